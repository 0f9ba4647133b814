#include <gtest/gtest.h>

#include "updater/updater_args.hpp"
#include "util/base64.hpp"

#include <string>
#include <vector>

namespace onova {
namespace {

TEST(UpdaterArgsTest, EncodesFivePositionalArguments) {
    UpdaterArgs args;
    args.updatee_file_path = "/opt/app/app";
    args.package_content_dir_path = "/home/u/.local/share/Onova/app/1.2.0.0";
    args.restart = true;
    args.routed_args = "--x";
    args.additional_executables = {"/opt/app/a", "/opt/app/b"};

    const auto argv = args.Encode();
    ASSERT_EQ(argv.size(), static_cast<size_t>(kUpdaterArgCount));
    EXPECT_EQ(argv[0], "/opt/app/app");
    EXPECT_EQ(argv[1], "/home/u/.local/share/Onova/app/1.2.0.0");
    EXPECT_EQ(argv[2], "True");
    EXPECT_EQ(argv[3], Base64Encode("--x"));
    EXPECT_EQ(argv[4], Base64Encode("/opt/app/a;/opt/app/b"));
}

TEST(UpdaterArgsTest, RoundTripsQuotesSpacesAndNonAscii) {
    UpdaterArgs args;
    args.updatee_file_path = "/opt/My App/app";
    args.package_content_dir_path = "/tmp/stage dir/2.0.0.0";
    args.restart = false;
    args.routed_args = R"(--title "it's a \"test\"" --path 'C:\dir' --name été 日本)";
    args.additional_executables = {"/opt/My App/helper one", "/opt/My App/tool\"2"};

    auto decoded = UpdaterArgs::Decode(args.Encode());
    ASSERT_TRUE(decoded.has_value()) << decoded.error();
    EXPECT_EQ(decoded->updatee_file_path, args.updatee_file_path);
    EXPECT_EQ(decoded->package_content_dir_path, args.package_content_dir_path);
    EXPECT_FALSE(decoded->restart);
    EXPECT_EQ(decoded->routed_args, args.routed_args);
    EXPECT_EQ(decoded->additional_executables, args.additional_executables);
}

TEST(UpdaterArgsTest, EmptyRoutedArgsAndExecutables) {
    UpdaterArgs args;
    args.updatee_file_path = "/a/b";
    args.package_content_dir_path = "/c/d";

    auto decoded = UpdaterArgs::Decode(args.Encode());
    ASSERT_TRUE(decoded.has_value()) << decoded.error();
    EXPECT_TRUE(decoded->routed_args.empty());
    EXPECT_TRUE(decoded->additional_executables.empty());
}

TEST(UpdaterArgsTest, RestartFlagIsCaseInsensitive) {
    for (const char* flag : {"True", "true", "TRUE"}) {
        auto d = UpdaterArgs::Decode({"/a", "/b", flag, "", ""});
        ASSERT_TRUE(d.has_value()) << flag;
        EXPECT_TRUE(d->restart);
    }
    auto f = UpdaterArgs::Decode({"/a", "/b", "fAlSe", "", ""});
    ASSERT_TRUE(f.has_value());
    EXPECT_FALSE(f->restart);
}

TEST(UpdaterArgsTest, RejectsMalformedArguments) {
    EXPECT_FALSE(UpdaterArgs::Decode({"/a", "/b", "True", ""}).has_value());
    EXPECT_FALSE(UpdaterArgs::Decode({"/a", "/b", "yes", "", ""}).has_value());
    EXPECT_FALSE(UpdaterArgs::Decode({"/a", "/b", "True", "not base64", ""}).has_value());
    EXPECT_FALSE(UpdaterArgs::Decode({"", "/b", "True", "", ""}).has_value());
}

} // namespace
} // namespace onova
