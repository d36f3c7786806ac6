#include <set>
#include <string>

#include <gtest/gtest.h>

#include "stash/storage/layout.hpp"

using stash::core::Flag;
using stash::storage::OnDiskFormat;

TEST(StorageLayout, ClassifyKnownFormats) {
    static_assert(stash::storage::layout_classify(Flag::No, Flag::No) == OnDiskFormat::Plain);
    EXPECT_EQ(stash::storage::layout_classify(Flag::Yes, Flag::No), OnDiskFormat::Compressed);
    EXPECT_EQ(stash::storage::layout_classify(Flag::No, Flag::Yes), OnDiskFormat::Encrypted);
    EXPECT_EQ(stash::storage::layout_classify(Flag::Yes, Flag::Yes), OnDiskFormat::EncryptedCompressed);
}

TEST(StorageLayout, AnyUnknownFlagIsLegacy) {
    EXPECT_EQ(stash::storage::layout_classify(Flag::Unknown, Flag::No), OnDiskFormat::LegacyUnknown);
    EXPECT_EQ(stash::storage::layout_classify(Flag::No, Flag::Unknown), OnDiskFormat::LegacyUnknown);
    EXPECT_EQ(stash::storage::layout_classify(Flag::Unknown, Flag::Unknown), OnDiskFormat::LegacyUnknown);
    EXPECT_STREQ(stash::storage::format_name(OnDiskFormat::LegacyUnknown), "legacy");
}

TEST(StorageLayout, Extension) {
    EXPECT_EQ(stash::storage::layout_extension("report.PDF"), ".pdf");
    EXPECT_EQ(stash::storage::layout_extension("archive.tar.gz"), ".gz");
    EXPECT_EQ(stash::storage::layout_extension("notes"), "");
    EXPECT_EQ(stash::storage::layout_extension(".bashrc"), "");
    EXPECT_EQ(stash::storage::layout_extension("dir.d/readme"), "");
    EXPECT_EQ(stash::storage::layout_extension("../../etc/passwd.txt"), ".txt");
}

TEST(StorageLayout, StorageNameIgnoresLogicalName) {
    std::set<std::string> seen;
    for (int i = 0; i < 32; ++i) {
        std::string name;
        ASSERT_EQ(stash::storage::layout_storage_name(".png", &name).code, stash::core::StatusCode::Ok);
        EXPECT_EQ(name.size(), stash::storage::kStorageTokenBytes * 2 + 4);
        EXPECT_EQ(name.substr(name.size() - 4), ".png");
        EXPECT_TRUE(stash::storage::layout_storage_name_valid(name));
        seen.insert(name);
    }
    EXPECT_EQ(seen.size(), 32u);
}

TEST(StorageLayout, StorageNameRejectsUnsafeExtension) {
    std::string name = "unchanged";
    EXPECT_EQ(stash::storage::layout_storage_name("/../x", &name).code, stash::core::StatusCode::Invalid);
    EXPECT_EQ(name, "unchanged");
}

TEST(StorageLayout, StorageNameValidation) {
    EXPECT_TRUE(stash::storage::layout_storage_name_valid("0123abcd.txt"));
    EXPECT_FALSE(stash::storage::layout_storage_name_valid(""));
    EXPECT_FALSE(stash::storage::layout_storage_name_valid(".stash-tmp-abc"));
    EXPECT_FALSE(stash::storage::layout_storage_name_valid("a/b"));
    EXPECT_FALSE(stash::storage::layout_storage_name_valid(".."));
    EXPECT_FALSE(stash::storage::layout_storage_name_valid("Upper.txt"));
    EXPECT_FALSE(stash::storage::layout_storage_name_valid(std::string(256, 'a')));
}

TEST(StorageLayout, ObjectPath) {
    EXPECT_EQ(stash::storage::layout_object_path("/data", "ab.txt"), "/data/ab.txt");
    EXPECT_EQ(stash::storage::layout_object_path("/data/", "ab.txt"), "/data/ab.txt");
}
