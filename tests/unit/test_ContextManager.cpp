#include <gtest/gtest.h>
#include "fakes.hpp"
#include "context/ContextManager.hpp"
#include "context/FileRegistry.hpp"
#include "context/model/TrackedFile.hpp"
#include "diff/DiffEngine.hpp"

#include <fstream>
#include <new>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace px::context;
using namespace px::context::model;
using namespace px::oracle;
using namespace px::test;

namespace {

const FileTypeInfo TEXT{FileCategory::Text, "text/plain"};

void writeFile(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

}

class ContextManagerTest : public ::testing::Test {
protected:
    fs::path root;
    std::shared_ptr<FakeClassifier> classifier = std::make_shared<FakeClassifier>();
    std::unique_ptr<ContextManager> manager;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = fs::temp_directory_path() / ("parallax_ctx_" + std::to_string(::getpid()) + "_" + info->name());
        fs::remove_all(root);
        fs::create_directories(root);

        Deps deps{.buffers = nullptr,
                  .disk = std::make_shared<LocalDisk>(),
                  .classifier = classifier,
                  .extractor = std::make_shared<FakeExtractor>()};
        manager = std::make_unique<ContextManager>(root, deps, px::config::SyncConfig{.worker_threads = 3, .diff_context_lines = 2});
    }

    void TearDown() override {
        manager.reset();
        fs::remove_all(root);
    }

    const SyncResult& resultFor(const SyncResults& results, const std::string& rel) const {
        return results.at(root / rel);
    }
};

TEST_F(ContextManagerTest, TracksAddsDiffsAndDeletes) {
    writeFile(root / "a.txt", "foo\n");
    manager->track("a.txt", TEXT);

    auto results = manager->syncAll();
    ASSERT_EQ(results.size(), 1u);
    const auto& first = resultFor(results, "a.txt");
    EXPECT_EQ(first.relPath, "a.txt");
    EXPECT_EQ(std::get<WholeFile>(std::get<Updated>(first.outcome).update).content, "foo\n");

    writeFile(root / "a.txt", "foo\nbar\n");
    results = manager->syncAll();
    const auto& patch = std::get<Diff>(std::get<Updated>(resultFor(results, "a.txt").outcome).update).patch;
    const auto summary = px::diff::summarize(px::diff::parsePatch(patch));
    EXPECT_EQ(summary.added, 1u);
    EXPECT_EQ(summary.removed, 0u);

    fs::remove(root / "a.txt");
    results = manager->syncAll();
    EXPECT_TRUE(std::holds_alternative<Deleted>(std::get<Updated>(resultFor(results, "a.txt").outcome).update));
    EXPECT_TRUE(manager->isEmpty());

    EXPECT_TRUE(manager->syncAll().empty());
}

TEST_F(ContextManagerTest, UnchangedFilesReportUnchanged) {
    writeFile(root / "a.txt", "foo\n");
    writeFile(root / "b.txt", "bar\n");
    manager->track("a.txt", TEXT);
    manager->track("b.txt", TEXT);
    (void)manager->syncAll();

    writeFile(root / "b.txt", "baz\n");
    const auto results = manager->syncAll();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<Unchanged>(resultFor(results, "a.txt").outcome));
    EXPECT_TRUE(isUpdate(resultFor(results, "b.txt").outcome));
}

TEST_F(ContextManagerTest, ManyFilesReconcileIndependently) {
    for (int i = 0; i < 40; ++i) {
        writeFile(root / ("f" + std::to_string(i) + ".txt"), "line " + std::to_string(i) + "\n");
        manager->track("f" + std::to_string(i) + ".txt", TEXT);
    }

    const auto results = manager->syncAll();
    ASSERT_EQ(results.size(), 40u);
    for (int i = 0; i < 40; ++i) {
        const auto& r = resultFor(results, "f" + std::to_string(i) + ".txt");
        EXPECT_EQ(std::get<WholeFile>(std::get<Updated>(r.outcome).update).content, "line " + std::to_string(i) + "\n");
    }

    for (const auto& file : manager->registry()->all())
        EXPECT_TRUE(std::holds_alternative<TextView>(file->remoteView()));
}

TEST_F(ContextManagerTest, ConcurrentPassesAreSerialized) {
    writeFile(root / "a.txt", "foo\n");
    manager->track("a.txt", TEXT);

    SyncResults r1, r2;
    std::thread t1([&] { r1 = manager->syncAll(); });
    std::thread t2([&] { r2 = manager->syncAll(); });
    t1.join();
    t2.join();

    // exactly one of the two passes saw the file for the first time
    const bool firstWhole = isUpdate(r1.at(root / "a.txt").outcome);
    const bool secondWhole = isUpdate(r2.at(root / "a.txt").outcome);
    EXPECT_NE(firstWhole, secondWhole);
}

TEST_F(ContextManagerTest, UnsupportedCategoryIsRejected) {
    writeFile(root / "blob.bin", "\x01\x02");
    EXPECT_THROW(manager->track("blob.bin", FileTypeInfo{FileCategory::Unsupported, "application/octet-stream"}),
                 UnsupportedCategoryError);

    classifier->set(root / "blob.bin", FileTypeInfo{FileCategory::Unsupported, "application/octet-stream"});
    EXPECT_THROW(manager->track("blob.bin"), UnsupportedCategoryError);
    EXPECT_TRUE(manager->isEmpty());
}

TEST_F(ContextManagerTest, TrackClassifiesAndRejectsMissingFiles) {
    writeFile(root / "a.txt", "foo\n");
    classifier->set(root / "a.txt", TEXT);

    const auto file = manager->track("a.txt");
    EXPECT_EQ(file->typeInfo.category, FileCategory::Text);
    EXPECT_EQ(manager->track(root / "a.txt"), file);

    EXPECT_THROW(manager->track("missing.txt"), std::runtime_error);
}

TEST_F(ContextManagerTest, UntrackRemovesFile) {
    writeFile(root / "a.txt", "foo\n");
    manager->track("a.txt", TEXT);
    EXPECT_TRUE(manager->untrack("a.txt"));
    EXPECT_FALSE(manager->untrack("a.txt"));
    EXPECT_TRUE(manager->syncAll().empty());
}

TEST_F(ContextManagerTest, ToolEditsMoveTheAgentView) {
    writeFile(root / "a.txt", "alpha\nbeta\n");
    classifier->set(root / "a.txt", TEXT);

    manager->toolApplied("a.txt", tool::GetFile{"alpha\nbeta\n"});
    EXPECT_TRUE(std::holds_alternative<Unchanged>(resultFor(manager->syncAll(), "a.txt").outcome));

    writeFile(root / "a.txt", "alpha\ngamma\nbeta\n");
    manager->toolApplied("a.txt", tool::Insert{"alpha\n", "gamma\n"});
    EXPECT_TRUE(std::holds_alternative<Unchanged>(resultFor(manager->syncAll(), "a.txt").outcome));

    writeFile(root / "a.txt", "alpha\ngamma\ndelta\n");
    manager->toolApplied("a.txt", tool::Replace{"beta", "delta"});
    EXPECT_TRUE(std::holds_alternative<Unchanged>(resultFor(manager->syncAll(), "a.txt").outcome));

    EXPECT_THROW(manager->toolApplied("a.txt", tool::Replace{"missing", "x"}), std::runtime_error);
}

TEST_F(ContextManagerTest, ToolEditOnUnseenFileReadsDisk) {
    writeFile(root / "a.txt", "edited\n");
    classifier->set(root / "a.txt", TEXT);

    manager->toolApplied("a.txt", tool::Insert{"", "edited"});
    const auto file = manager->registry()->get(root / "a.txt");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(std::get<TextView>(file->remoteView()).content, "edited\n");
}

TEST_F(ContextManagerTest, TextEditOnBinaryFileIsLogicError) {
    writeFile(root / "pic.png", "png");
    classifier->set(root / "pic.png", FileTypeInfo{FileCategory::Image, "image/png"});

    EXPECT_THROW(manager->toolApplied("pic.png", tool::Insert{"", "x"}), std::logic_error);
    EXPECT_NO_THROW(manager->toolApplied("pic.png", tool::GetFileBinary{42}));
}

TEST_F(ContextManagerTest, ResetResendsWholeFiles) {
    writeFile(root / "a.txt", "foo\n");
    manager->track("a.txt", TEXT);
    (void)manager->syncAll();

    manager->reset();
    const auto results = manager->syncAll();
    EXPECT_TRUE(std::holds_alternative<WholeFile>(std::get<Updated>(resultFor(results, "a.txt").outcome).update));
}

TEST_F(ContextManagerTest, AutoContextTracksMatchingFiles) {
    writeFile(root / "README.md", "# readme\n");
    writeFile(root / "docs/guide.md", "guide\n");
    writeFile(root / "docs/logo.bin", "xx");
    writeFile(root / "src/main.cpp", "int main() {}\n");
    classifier->set(root / "README.md", TEXT);
    classifier->set(root / "docs/guide.md", TEXT);
    classifier->set(root / "docs/logo.bin", FileTypeInfo{FileCategory::Unsupported, "application/octet-stream"});

    const auto added = manager->loadAutoContext({"readme.md", "docs/*", "README.md"});
    EXPECT_EQ(added, 2u);
    EXPECT_TRUE(manager->registry()->contains(root / "README.md"));
    EXPECT_TRUE(manager->registry()->contains(root / "docs/guide.md"));
    EXPECT_FALSE(manager->registry()->contains(root / "docs/logo.bin"));
    EXPECT_FALSE(manager->registry()->contains(root / "src/main.cpp"));
}

TEST_F(ContextManagerTest, PathReplacedByDirectoryFailsOnlyThatFile) {
    writeFile(root / "a.txt", "foo\n");
    writeFile(root / "b.txt", "bar\n");
    manager->track("a.txt", TEXT);
    manager->track("b.txt", TEXT);
    (void)manager->syncAll();

    writeFile(root / "a.txt", "foo\nmore\n");
    fs::remove(root / "b.txt");
    fs::create_directories(root / "b.txt");

    SyncResults results;
    ASSERT_NO_THROW(results = manager->syncAll());
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<Diff>(std::get<Updated>(resultFor(results, "a.txt").outcome).update));

    const auto* err = std::get_if<SyncError>(&resultFor(results, "b.txt").outcome);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->kind, SyncErrorKind::IoError);
    EXPECT_TRUE(manager->registry()->contains(root / "b.txt"));
    EXPECT_EQ(std::get<TextView>(manager->registry()->get(root / "b.txt")->remoteView()).content, "bar\n");
}

// Same pass machinery over in-memory oracles, one worker so buffer state is not shared across threads.
class ContextManagerPassTest : public ::testing::Test {
protected:
    const fs::path root{"/w"};
    std::shared_ptr<FakeDisk> disk = std::make_shared<FakeDisk>();
    std::shared_ptr<FakeBuffers> buffers = std::make_shared<FakeBuffers>(disk);
    std::shared_ptr<FakeExtractor> extractor = std::make_shared<FakeExtractor>();
    std::unique_ptr<ContextManager> manager;

    void SetUp() override {
        Deps deps{.buffers = buffers, .disk = disk, .classifier = nullptr, .extractor = extractor};
        manager = std::make_unique<ContextManager>(root, deps, px::config::SyncConfig{.worker_threads = 1, .diff_context_lines = 2});
    }

    void TearDown() override { manager.reset(); }

    const SyncResult& resultFor(const SyncResults& results, const std::string& rel) const {
        return results.at(root / rel);
    }

    SyncErrorKind errorKind(const SyncResults& results, const std::string& rel) const {
        const auto* err = std::get_if<SyncError>(&resultFor(results, rel).outcome);
        if (!err) throw std::runtime_error(rel + " did not fail");
        return err->kind;
    }
};

TEST_F(ContextManagerPassTest, FailuresStayWithTheirFiles) {
    disk->write("/w/ok.txt", "one\n", 1);
    disk->write("/w/edited.txt", "base\n", 1);
    disk->write("/w/gone.txt", "x\n", 1);
    disk->write("/w/doc.pdf", "%PDF", 1);
    buffers->open("/w/edited.txt", {"base", ""}, 1, 0);
    manager->track("ok.txt", TEXT);
    manager->track("edited.txt", TEXT);
    manager->track("gone.txt", TEXT);
    manager->track("doc.pdf", FileTypeInfo{FileCategory::Pdf, "application/pdf"});
    (void)manager->syncAll();

    disk->write("/w/ok.txt", "one\ntwo\n", 2);
    buffers->edit("/w/edited.txt", {"mine", ""});
    disk->write("/w/edited.txt", "theirs\n", 2);
    disk->write("/w/gone.txt", "x\ny\n", 2);
    disk->fault("/w/gone.txt", std::make_exception_ptr(
        fs::filesystem_error("read", "/w/gone.txt", std::make_error_code(std::errc::io_error))));
    disk->write("/w/doc.pdf", "%PDF-2", 2);
    extractor->fail = true;

    SyncResults results;
    ASSERT_NO_THROW(results = manager->syncAll());
    ASSERT_EQ(results.size(), 4u);
    EXPECT_TRUE(std::holds_alternative<Diff>(std::get<Updated>(resultFor(results, "ok.txt").outcome).update));
    EXPECT_EQ(errorKind(results, "edited.txt"), SyncErrorKind::Conflict);
    EXPECT_EQ(errorKind(results, "gone.txt"), SyncErrorKind::IoError);
    EXPECT_EQ(errorKind(results, "doc.pdf"), SyncErrorKind::ExtractionFailed);

    // the failed files are retried on the next pass, the delivered one is not resent
    disk->fault("/w/gone.txt", nullptr);
    extractor->fail = false;
    results = manager->syncAll();
    EXPECT_TRUE(std::holds_alternative<Unchanged>(resultFor(results, "ok.txt").outcome));
    EXPECT_TRUE(std::holds_alternative<Diff>(std::get<Updated>(resultFor(results, "gone.txt").outcome).update));
    EXPECT_TRUE(isUpdate(resultFor(results, "doc.pdf").outcome));
}

TEST_F(ContextManagerPassTest, UnexpectedExceptionBecomesIoError) {
    disk->write("/w/a.txt", "a\n", 1);
    disk->write("/w/b.txt", "b\n", 1);
    manager->track("a.txt", TEXT);
    manager->track("b.txt", TEXT);
    disk->fault("/w/b.txt", std::make_exception_ptr(std::bad_alloc()));

    SyncResults results;
    ASSERT_NO_THROW(results = manager->syncAll());
    EXPECT_TRUE(std::holds_alternative<WholeFile>(std::get<Updated>(resultFor(results, "a.txt").outcome).update));
    EXPECT_EQ(errorKind(results, "b.txt"), SyncErrorKind::IoError);
    EXPECT_TRUE(std::holds_alternative<NotSeen>(manager->registry()->get("/w/b.txt")->remoteView()));
}

TEST_F(ContextManagerPassTest, FailedPassRollsBackDeliveredViews) {
    disk->write("/w/a.txt", "a\n", 1);
    disk->write("/w/b.txt", "b\n", 1);
    disk->write("/w/c.txt", "c\n", 1);
    manager->track("a.txt", TEXT);
    manager->track("b.txt", TEXT);
    manager->track("c.txt", TEXT);
    (void)manager->syncAll();

    disk->write("/w/a.txt", "a\nchanged\n", 2);
    disk->erase("/w/c.txt");
    disk->fault("/w/b.txt", std::make_exception_ptr(std::logic_error("broken invariant")));

    EXPECT_THROW((void)manager->syncAll(), std::logic_error);
    EXPECT_EQ(std::get<TextView>(manager->registry()->get("/w/a.txt")->remoteView()).content, "a\n");
    ASSERT_TRUE(manager->registry()->contains("/w/c.txt"));
    EXPECT_EQ(std::get<TextView>(manager->registry()->get("/w/c.txt")->remoteView()).content, "c\n");

    disk->fault("/w/b.txt", nullptr);
    const auto results = manager->syncAll();
    EXPECT_TRUE(std::holds_alternative<Diff>(std::get<Updated>(resultFor(results, "a.txt").outcome).update));
    EXPECT_TRUE(std::holds_alternative<Unchanged>(resultFor(results, "b.txt").outcome));
    EXPECT_TRUE(std::holds_alternative<Deleted>(std::get<Updated>(resultFor(results, "c.txt").outcome).update));
    EXPECT_FALSE(manager->registry()->contains("/w/c.txt"));
}
