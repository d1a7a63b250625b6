#include "../client/credential_store.hpp"
#include "temp_dir.hpp"
#include <gtest/gtest.h>
#include <fstream>

namespace {

void write_text(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

} // namespace

TEST(FileCredentialStore, LoadsOwnersAndSkipsJunk) {
    TempDir dir;
    write_text(dir.file("creds.txt"),
               "# owner api_id api_hash session\n"
               "\n"
               "7 1001 hash7 sess7\n"
               "8 1002 hash8\n"
               "x 1003 hash9 sess9\n"
               "9 1004 hash9 sess9 extra\n"
               "-3 1005 hashm sessm\n");
    FileCredentialStore store;
    EXPECT_EQ(store.load(dir.file("creds.txt")), 2u);
    EXPECT_EQ(store.size(), 2u);

    auto creds = store.get_credentials(7);
    ASSERT_TRUE(creds.has_value());
    EXPECT_EQ(creds->api_id, 1001u);
    EXPECT_EQ(creds->api_hash, "hash7");
    EXPECT_EQ(store.get_session_string(7).value_or(""), "sess7");
    EXPECT_TRUE(store.get_credentials(-3).has_value());
    EXPECT_FALSE(store.get_credentials(8).has_value());
    EXPECT_FALSE(store.get_session_string(9).has_value());
}

TEST(FileCredentialStore, MissingFileThrows) {
    FileCredentialStore store;
    EXPECT_THROW(store.load("/nonexistent/parxfer/creds.txt"), std::runtime_error);
}

TEST(FileCredentialStore, DefaultsCoverUnknownOwners) {
    FileCredentialStore store;
    store.set(1, Credentials{11, "h1"}, "s1");
    EXPECT_FALSE(store.get_credentials(2).has_value());

    store.set_default(Credentials{99, "hd"}, "sd");
    EXPECT_EQ(store.get_credentials(2)->api_id, 99u);
    EXPECT_EQ(store.get_session_string(2).value_or(""), "sd");
    EXPECT_EQ(store.get_credentials(1)->api_id, 11u);
}

TEST(FileCredentialStore, IncompleteDefaultsAreIgnored) {
    FileCredentialStore store;
    store.set_default(Credentials{0, ""}, "");
    EXPECT_FALSE(store.get_credentials(5).has_value());
    EXPECT_FALSE(store.get_session_string(5).has_value());
}
