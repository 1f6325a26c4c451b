#include "../keychain_store.hpp"
#include <Security/Security.h>
#include <CoreFoundation/CoreFoundation.h>
#include <fmt/format.h>

namespace {

// Owns one CoreFoundation reference; released on every exit path.
template <typename T>
class CFHolder {
public:
    explicit CFHolder(T ref = nullptr) : ref_(ref) {}
    ~CFHolder() { if (ref_) CFRelease(ref_); }

    CFHolder(const CFHolder&) = delete;
    CFHolder& operator=(const CFHolder&) = delete;

    T get() const { return ref_; }
    explicit operator bool() const { return ref_ != nullptr; }

private:
    T ref_;
};

CFStringRef cf_str(const std::string& s) {
    return CFStringCreateWithBytes(kCFAllocatorDefault,
                                   reinterpret_cast<const UInt8*>(s.data()),
                                   static_cast<CFIndex>(s.size()),
                                   kCFStringEncodingUTF8, false);
}

CFDataRef cf_data(const Bytes& bytes) {
    return CFDataCreate(kCFAllocatorDefault, bytes.data(), static_cast<CFIndex>(bytes.size()));
}

CFMutableDictionaryRef new_dictionary() {
    return CFDictionaryCreateMutable(kCFAllocatorDefault, 0,
                                     &kCFTypeDictionaryKeyCallBacks,
                                     &kCFTypeDictionaryValueCallBacks);
}

CFTypeRef sec_class(RecordClass cls) {
    switch (cls) {
        case RecordClass::GenericPassword: return kSecClassGenericPassword;
    }
    return kSecClassGenericPassword;
}

// Adds a string attribute. The dictionary retains the value.
bool set_string(CFMutableDictionaryRef dict, CFStringRef key, const std::string& value) {
    CFHolder<CFStringRef> s(cf_str(value));
    if (!s) return false;
    CFDictionarySetValue(dict, key, s.get());
    return true;
}

// Fill class and attribute constraints. False if an attribute could not be converted.
bool apply_attributes(CFMutableDictionaryRef dict, RecordClass cls,
                      const std::optional<std::string>& account,
                      const std::optional<std::string>& service,
                      const std::optional<std::string>& access_group) {
    CFDictionarySetValue(dict, kSecClass, sec_class(cls));
    if (account && !set_string(dict, kSecAttrAccount, *account)) return false;
    if (service && !set_string(dict, kSecAttrService, *service)) return false;
    if (access_group && !set_string(dict, kSecAttrAccessGroup, *access_group)) return false;
    return true;
}

} // namespace

StoreStatus KeychainStore::insert(const Record& record) {
    CFHolder<CFMutableDictionaryRef> attrs(new_dictionary());
    CFHolder<CFDataRef> data(cf_data(record.data));
    if (!attrs || !data) return errSecAllocate;

    if (!apply_attributes(attrs.get(), record.record_class, record.account,
                          record.service, record.access_group)) {
        return errSecParam;
    }
    CFDictionarySetValue(attrs.get(), kSecValueData, data.get());

    return SecItemAdd(attrs.get(), nullptr);
}

LookupResult KeychainStore::lookup(const Query& query) {
    CFHolder<CFMutableDictionaryRef> q(new_dictionary());
    if (!q) return {errSecAllocate, std::nullopt};

    if (!apply_attributes(q.get(), query.record_class, query.account,
                          query.service, query.access_group)) {
        return {errSecParam, std::nullopt};
    }
    CFDictionarySetValue(q.get(), kSecReturnData,
                         query.return_data ? kCFBooleanTrue : kCFBooleanFalse);
    CFDictionarySetValue(q.get(), kSecMatchLimit, kSecMatchLimitOne);

    if (!query.return_data) {
        OSStatus status = SecItemCopyMatching(q.get(), nullptr);
        return {status, std::nullopt};
    }

    CFTypeRef result = nullptr;
    OSStatus status = SecItemCopyMatching(q.get(), &result);
    CFHolder<CFTypeRef> owned(result);
    if (status != errSecSuccess) return {status, std::nullopt};
    if (!owned || CFGetTypeID(owned.get()) != CFDataGetTypeID()) {
        return {errSecDecode, std::nullopt};
    }

    CFDataRef data = static_cast<CFDataRef>(owned.get());
    const UInt8* bytes = CFDataGetBytePtr(data);
    Bytes payload(bytes, bytes + CFDataGetLength(data));
    return {errSecSuccess, std::move(payload)};
}

StoreStatus KeychainStore::update(const Query& query, const Bytes& payload) {
    CFHolder<CFMutableDictionaryRef> q(new_dictionary());
    CFHolder<CFMutableDictionaryRef> changes(new_dictionary());
    CFHolder<CFDataRef> data(cf_data(payload));
    if (!q || !changes || !data) return errSecAllocate;

    if (!apply_attributes(q.get(), query.record_class, query.account,
                          query.service, query.access_group)) {
        return errSecParam;
    }
    CFDictionarySetValue(changes.get(), kSecValueData, data.get());

    return SecItemUpdate(q.get(), changes.get());
}

StoreStatus KeychainStore::remove(const Query& query) {
    CFHolder<CFMutableDictionaryRef> q(new_dictionary());
    if (!q) return errSecAllocate;

    if (!apply_attributes(q.get(), query.record_class, query.account,
                          query.service, query.access_group)) {
        return errSecParam;
    }
    return SecItemDelete(q.get());
}

std::string KeychainStore::describe(StoreStatus status) const {
    CFHolder<CFStringRef> message(SecCopyErrorMessageString(status, nullptr));
    if (!message) return SecureStore::describe(status);

    CFIndex len = CFStringGetLength(message.get());
    CFIndex max = CFStringGetMaximumSizeForEncoding(len, kCFStringEncodingUTF8) + 1;
    std::string out(static_cast<size_t>(max), '\0');
    if (!CFStringGetCString(message.get(), &out[0], max, kCFStringEncodingUTF8)) {
        return fmt::format("OSStatus {}", status);
    }
    out.resize(std::char_traits<char>::length(out.c_str()));
    return out;
}
