#include <gtest/gtest.h>
#include <store/preference_file_store.hpp>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

class PreferenceFileStoreTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path store_path;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "kvault_preference_store_test" /
                   ::testing::UnitTest::GetInstance()->current_test_info()->name();
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        store_path = test_dir / "nested" / "preferences.yaml";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    static Record record(const std::string& account, const std::string& service,
                         Bytes data) {
        Record r;
        r.account = account;
        r.service = service;
        r.data = std::move(data);
        return r;
    }

    static Query query(const std::string& account, bool return_data = true) {
        Query q;
        q.account = account;
        q.return_data = return_data;
        return q;
    }
};

TEST_F(PreferenceFileStoreTest, MissingFileIsEmptyStore) {
    PreferenceFileStore store(store_path);
    EXPECT_EQ(store.lookup(query("token")).status, STATUS_ITEM_NOT_FOUND);
    EXPECT_FALSE(fs::exists(store_path));
}

TEST_F(PreferenceFileStoreTest, PersistsAcrossInstances) {
    Bytes payload = {0x00, 0xF9, 0xFF, 'a'};
    {
        PreferenceFileStore store(store_path);
        ASSERT_EQ(store.insert(record("token", "app.test", payload)), STATUS_SUCCESS);
    }

    PreferenceFileStore reopened(store_path);
    LookupResult r = reopened.lookup(query("token"));
    ASSERT_EQ(r.status, STATUS_SUCCESS);
    ASSERT_TRUE(r.payload.has_value());
    EXPECT_EQ(*r.payload, payload);
    EXPECT_EQ(reopened.insert(record("token", "app.test", {})), STATUS_DUPLICATE_ITEM);
}

TEST_F(PreferenceFileStoreTest, FileIsOwnerOnly) {
    PreferenceFileStore store(store_path);
    ASSERT_EQ(store.insert(record("token", "app.test", {1})), STATUS_SUCCESS);

    struct stat st;
    ASSERT_EQ(stat(store_path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST_F(PreferenceFileStoreTest, EmptyPayloadAndUnscopedRecord) {
    PreferenceFileStore store(store_path);
    Record r;
    r.account = "empty";
    ASSERT_EQ(store.insert(r), STATUS_SUCCESS);

    LookupResult found = store.lookup(query("empty"));
    ASSERT_EQ(found.status, STATUS_SUCCESS);
    EXPECT_TRUE(found.payload->empty());

    Query scoped = query("empty");
    scoped.service = "app.test";
    EXPECT_EQ(store.lookup(scoped).status, STATUS_ITEM_NOT_FOUND);
}

TEST_F(PreferenceFileStoreTest, UpdateAndRemove) {
    PreferenceFileStore store(store_path);
    EXPECT_EQ(store.update(query("k"), {1}), STATUS_ITEM_NOT_FOUND);

    ASSERT_EQ(store.insert(record("k", "svc", {1})), STATUS_SUCCESS);
    EXPECT_EQ(store.update(query("k"), {2, 3}), STATUS_SUCCESS);
    EXPECT_EQ(*store.lookup(query("k")).payload, (Bytes{2, 3}));

    EXPECT_EQ(store.remove(query("k")), STATUS_SUCCESS);
    EXPECT_EQ(store.remove(query("k")), STATUS_ITEM_NOT_FOUND);
    EXPECT_EQ(store.lookup(query("k")).status, STATUS_ITEM_NOT_FOUND);
}

TEST_F(PreferenceFileStoreTest, CorruptFileReportsDecodeAndIsLeftAlone) {
    fs::create_directories(store_path.parent_path());
    std::ofstream(store_path) << "records: [ {class: \"bogus\", account: k, data: \"\"} ]\n";

    PreferenceFileStore store(store_path);
    EXPECT_EQ(store.lookup(query("k")).status, STATUS_DECODE);
    EXPECT_EQ(store.insert(record("x", "svc", {1})), STATUS_DECODE);

    std::ifstream in(store_path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("bogus"), std::string::npos);
}

TEST_F(PreferenceFileStoreTest, UnparsableYamlReportsDecode) {
    fs::create_directories(store_path.parent_path());
    std::ofstream(store_path) << "records: [unterminated\n";

    PreferenceFileStore store(store_path);
    EXPECT_EQ(store.lookup(query("k")).status, STATUS_DECODE);
}

TEST_F(PreferenceFileStoreTest, RelativePathInWorkingDirectory) {
    fs::path old_cwd = fs::current_path();
    fs::current_path(test_dir);
    {
        PreferenceFileStore store("prefs.yaml");
        EXPECT_EQ(store.insert(record("k", "svc", {4})), STATUS_SUCCESS);
        EXPECT_EQ(store.update(query("k"), {5}), STATUS_SUCCESS);
        EXPECT_EQ(*store.lookup(query("k")).payload, (Bytes{5}));
        EXPECT_EQ(store.remove(query("k")), STATUS_SUCCESS);
    }
    fs::current_path(old_cwd);
    EXPECT_TRUE(fs::exists(test_dir / "prefs.yaml"));
}

TEST_F(PreferenceFileStoreTest, RecordsOfWrongShapeLeaveFileUntouched) {
    const std::string mapped = "records:\n  precious: keepme\n";
    const std::string scalars = "records:\n  - just a string\n";

    for (const std::string& content : {mapped, scalars}) {
        fs::create_directories(store_path.parent_path());
        { std::ofstream(store_path) << content; }

        PreferenceFileStore store(store_path);
        EXPECT_EQ(store.lookup(query("k")).status, STATUS_DECODE);
        EXPECT_EQ(store.insert(record("x", "svc", {1})), STATUS_DECODE);

        std::ifstream in(store_path);
        std::string after((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        EXPECT_EQ(after, content);
    }
}
