#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include "filevault/authenticator.hpp"
#include "filevault/errors.hpp"
#include "filevault/file_service.hpp"
#include "filevault/name_generator.hpp"
#include "filevault/path_sanitizer.hpp"
#include "filevault/storage_engine.hpp"
#include "filevault/storage_root.hpp"
#include "test_helpers.hpp"

using namespace filevault;
namespace fs = std::filesystem;

namespace {

const std::string kSecret = "upload-secret";
const std::string kBaseUrl = "http://files.example.test";

} // namespace

class FileServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::quietLogs();
        build(3 * 1024 * 1024, true, kSecret);
    }

    void build(uint64_t maxFileSize, bool publicRead, const std::string& secret) {
        service.reset();
        engine.reset();
        sanitizer.reset();
        root.reset();
        dir = std::make_unique<test::TempDir>();

        root = std::make_unique<StorageRoot>((dir->path() / "store").string());
        sanitizer = std::make_unique<PathSanitizer>(*root);
        authenticator = std::make_unique<Authenticator>(secret);

        StorageLimits limits;
        limits.maxFileSize = maxFileSize;
        limits.blockedExtensions = {"exe", "bat", "sh"};
        engine = std::make_unique<StorageEngine>(*root, limits);

        service = std::make_unique<FileService>(*authenticator, *sanitizer, generator, *engine,
                                                kBaseUrl, publicRead);
    }

    UploadResult upload(const std::string& name, const std::string& content,
                        const std::string& secret = kSecret) {
        std::istringstream stream(content);
        UploadRequest request;
        request.secret = secret;
        request.originalName = name;
        request.stream = &stream;
        request.declaredSize = content.size();
        return service->upload(request);
    }

    std::unique_ptr<test::TempDir> dir;
    std::unique_ptr<StorageRoot> root;
    std::unique_ptr<PathSanitizer> sanitizer;
    std::unique_ptr<Authenticator> authenticator;
    NameGenerator generator;
    std::unique_ptr<StorageEngine> engine;
    std::unique_ptr<FileService> service;
};

TEST_F(FileServiceTest, UploadsTwoMegabyteReport) {
    std::string payload = test::binaryPayload(2097152);

    UploadResult result = upload("report.pdf", payload);

    EXPECT_TRUE(NameGenerator::isValidStoredName(result.storedName));
    EXPECT_EQ(result.storedName.substr(result.storedName.size() - 11), "_report.pdf");
    EXPECT_EQ(result.sizeBytes, 2097152u);
    EXPECT_EQ(result.url, kBaseUrl + "/files/" + result.storedName);
    EXPECT_EQ(fs::file_size(root->path() / result.storedName), 2097152u);

    auto entries = service->list(kSecret);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].storedName, result.storedName);
    EXPECT_EQ(entries[0].sizeBytes, 2097152u);
    EXPECT_EQ(entries[0].url, result.url);
}

TEST_F(FileServiceTest, WrongAndMissingSecretsFailAlike) {
    try {
        upload("a.txt", "hello", "nope");
        FAIL() << "expected AuthError";
    } catch (const AuthError& e) {
        EXPECT_EQ(e.stage(), Stage::AUTHENTICATION);
        EXPECT_STREQ(e.what(), "Invalid password");
    }

    build(1024, true, "");
    for (const std::string& attempt : {std::string(""), std::string("anything")}) {
        try {
            upload("a.txt", "hello", attempt);
            FAIL() << "expected AuthError";
        } catch (const AuthError& e) {
            EXPECT_EQ(e.stage(), Stage::AUTHENTICATION);
            EXPECT_STREQ(e.what(), "Invalid password");
        }
    }

    EXPECT_TRUE(test::allEntries(root->path()).empty());
}

TEST_F(FileServiceTest, AuthenticationPrecedesValidation) {
    EXPECT_THROW(upload("../../etc/passwd", "x", "wrong"), AuthError);
    EXPECT_THROW(upload("virus.exe", "x", "wrong"), AuthError);
    EXPECT_THROW(service->remove("wrong", "../secret"), AuthError);
    EXPECT_THROW(service->list("wrong"), AuthError);
}

TEST_F(FileServiceTest, ReadReturnsBytesAndContentType) {
    std::string payload = test::binaryPayload(4096);
    UploadResult result = upload("photo.PNG", payload);

    ReadResult read = service->read("", result.storedName);

    EXPECT_EQ(read.storedName, result.storedName);
    EXPECT_EQ(read.contentType, "image/png");
    EXPECT_EQ(read.content, payload);
}

TEST_F(FileServiceTest, PrivateReadsRequireSecret) {
    build(1024, false, kSecret);
    UploadResult result = upload("notes.txt", "private notes");

    EXPECT_THROW(service->read("", result.storedName), AuthError);
    EXPECT_EQ(service->read(kSecret, result.storedName).content, "private notes");
}

TEST_F(FileServiceTest, DeleteIsFinal) {
    UploadResult result = upload("once.txt", "content");

    EXPECT_NO_THROW(service->remove(kSecret, result.storedName));
    EXPECT_FALSE(fs::exists(root->path() / result.storedName));

    for (int attempt = 0; attempt < 2; ++attempt) {
        try {
            service->remove(kSecret, result.storedName);
            FAIL() << "expected NotFoundError";
        } catch (const NotFoundError& e) {
            EXPECT_EQ(e.stage(), Stage::DELETION);
        }
    }

    EXPECT_THROW(service->read("", result.storedName), NotFoundError);
    EXPECT_TRUE(service->list(kSecret).empty());
}

TEST_F(FileServiceTest, DeleteRejectsTraversal) {
    auto outside = dir->path() / "victim.txt";
    test::writeFile(outside, "keep me");

    EXPECT_THROW(service->remove(kSecret, "../victim.txt"), InvalidNameError);
    EXPECT_THROW(service->remove(kSecret, "/etc/passwd"), InvalidNameError);
    EXPECT_THROW(service->read("", "../victim.txt"), InvalidNameError);
    EXPECT_TRUE(fs::exists(outside));
}

TEST_F(FileServiceTest, DuplicateOriginalNamesStayDistinct) {
    std::set<std::string> names;
    for (int i = 0; i < 5; ++i) {
        names.insert(upload("same.txt", "version " + std::to_string(i)).storedName);
    }

    EXPECT_EQ(names.size(), 5u);
    EXPECT_EQ(service->list(kSecret).size(), 5u);
}

TEST_F(FileServiceTest, SizeLimitIsInclusive) {
    build(1000, true, kSecret);

    EXPECT_NO_THROW(upload("fits.bin", test::binaryPayload(1000)));

    try {
        upload("spill.bin", test::binaryPayload(1001));
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_TRUE(e.sizeExceeded());
    }

    EXPECT_EQ(test::allEntries(root->path()).size(), 1u);
}

TEST_F(FileServiceTest, RejectsBlockedTypesAndMissingInput) {
    EXPECT_THROW(upload("setup.EXE", "%payload"), ValidationError);
    EXPECT_THROW(upload("", "data"), ValidationError);

    UploadRequest request;
    request.secret = kSecret;
    request.originalName = "a.txt";
    try {
        service->upload(request);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "No file provided");
    }

    EXPECT_TRUE(test::allEntries(root->path()).empty());
}

TEST_F(FileServiceTest, HostileOriginalNameStillStoresSafely) {
    UploadResult result = upload("../../etc/cron.d/job.txt", "harmless");

    EXPECT_TRUE(NameGenerator::isValidStoredName(result.storedName));
    EXPECT_TRUE(fs::exists(root->path() / result.storedName));
    EXPECT_FALSE(fs::exists(dir->path() / "etc"));
}

TEST(ContentTypeTest, MapsKnownExtensions) {
    EXPECT_EQ(FileService::contentTypeFor("a.jpg"), "image/jpeg");
    EXPECT_EQ(FileService::contentTypeFor("a.JPEG"), "image/jpeg");
    EXPECT_EQ(FileService::contentTypeFor("a.mp4"), "video/mp4");
    EXPECT_EQ(FileService::contentTypeFor("a.pdf"), "application/pdf");
    EXPECT_EQ(FileService::contentTypeFor("a.unknown"), "application/octet-stream");
    EXPECT_EQ(FileService::contentTypeFor("noext"), "application/octet-stream");
}

TEST(FileIconTest, GroupsByExtension) {
    EXPECT_EQ(FileService::iconFor("holiday.JPG"), "🖼️");
    EXPECT_EQ(FileService::iconFor("clip.mkv"), "🎬");
    EXPECT_EQ(FileService::iconFor("budget.xlsx"), "📊");
    EXPECT_EQ(FileService::iconFor("backup.tar"), "📦");
    EXPECT_EQ(FileService::iconFor("main.rs"), "🦀");
    EXPECT_EQ(FileService::iconFor("noext"), "📎");
    EXPECT_EQ(FileService::iconFor("weird.qqq"), "📎");
}
