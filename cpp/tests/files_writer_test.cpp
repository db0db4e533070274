#include <gtest/gtest.h>

#include <atomic>
#include <cstring>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "restor/restore/files_writer.hpp"
#include "restor/restore/zero_block.hpp"
#include "test_support.hpp"

using namespace restor::core;
using namespace restor::restore;
using restor::storage::BufferView;
using restor::test::bytes_of;
using restor::test::CountingFileOps;
using restor::test::read_all;
using restor::test::RefusingTruncateFileOps;
using restor::test::ShortWriteFileOps;

namespace {
    BufferView view_of(const std::vector<u8>& v) {
        return BufferView{v.data(), static_cast<u32>(v.size())};
    }

    bool all_zero(const std::vector<u8>& v) {
        for (u8 b : v) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }
} // namespace

class FilesWriterTest : public ::testing::TestWithParam<u32> {
protected:
    void SetUp() override {
        dir_ = restor::test::make_temp_dir("files_writer");
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::string path(const std::string& name) const {
        return dir_ + "/" + name;
    }

    std::string dir_;
};

// ============================================================================
// Content
// ============================================================================

TEST_P(FilesWriterTest, ContentIsConcatenationOfWrites) {
    CountingFileOps ops;
    FilesWriter w(FilesWriterConfig{GetParam()}, &ops);
    const std::string p = path("blobs");

    std::vector<u8> expected;
    for (int i = 0; i < 10; ++i) {
        std::vector<u8> blob(100 + i * 37);
        for (size_t j = 0; j < blob.size(); ++j) {
            blob[j] = static_cast<u8>((i * 31 + j) & 0xFF);
        }
        ASSERT_TRUE(is_ok(w.write_to_file(p.c_str(), view_of(blob))));
        expected.insert(expected.end(), blob.begin(), blob.end());
    }
    w.close(p.c_str());

    EXPECT_EQ(read_all(p), expected);
    EXPECT_EQ(ops.open_now.load(), 0);
}

TEST_P(FilesWriterTest, InterleavedFilesKeepTheirOwnContent) {
    CountingFileOps ops;
    FilesWriter w(FilesWriterConfig{GetParam()}, &ops);
    const std::string a = path("a");
    const std::string b = path("b");
    const std::string c = path("c");

    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(is_ok(w.write_to_file(a.c_str(), view_of(bytes_of("a")))));
        ASSERT_TRUE(is_ok(w.write_to_file(b.c_str(), view_of(bytes_of("bb")))));
        ASSERT_TRUE(is_ok(w.write_to_file(c.c_str(), view_of(bytes_of("ccc")))));
        EXPECT_LE(w.cache().cached_count(), GetParam());
    }
    w.close(a.c_str());
    w.close(b.c_str());
    w.close(c.c_str());

    EXPECT_EQ(read_all(a), bytes_of("aaaa"));
    EXPECT_EQ(read_all(b), bytes_of("bbbbbbbb"));
    EXPECT_EQ(read_all(c), bytes_of("cccccccccccc"));
    EXPECT_EQ(ops.open_now.load(), 0);
}

TEST_P(FilesWriterTest, FirstWriteTruncatesExistingFile) {
    const std::string p = path("existing");
    {
        FilesWriter w(FilesWriterConfig{GetParam()});
        ASSERT_TRUE(is_ok(w.write_to_file(p.c_str(), view_of(bytes_of("stale content from before")))));
        w.close(p.c_str());
    }

    FilesWriter w(FilesWriterConfig{GetParam()});
    ASSERT_TRUE(is_ok(w.write_to_file(p.c_str(), view_of(bytes_of("new")))));
    w.close(p.c_str());
    EXPECT_EQ(read_all(p), bytes_of("new"));
}

TEST_P(FilesWriterTest, WriteAfterCloseStartsOver) {
    CountingFileOps ops;
    FilesWriter w(FilesWriterConfig{GetParam()}, &ops);
    const std::string p = path("reused");

    ASSERT_TRUE(is_ok(w.write_to_file(p.c_str(), view_of(bytes_of("first")))));
    w.close(p.c_str());
    EXPECT_FALSE(w.cache().is_cached(p.c_str()));
    EXPECT_FALSE(w.cache().is_in_progress(p.c_str()));
    EXPECT_EQ(ops.open_now.load(), 0);

    ASSERT_TRUE(is_ok(w.write_to_file(p.c_str(), view_of(bytes_of("second")))));
    w.close(p.c_str());
    EXPECT_EQ(read_all(p), bytes_of("second"));
}

TEST_P(FilesWriterTest, EmptyWriteCreatesEmptyFile) {
    FilesWriter w(FilesWriterConfig{GetParam()});
    const std::string p = path("empty");
    ASSERT_TRUE(is_ok(w.write_to_file(p.c_str(), BufferView{})));
    w.close(p.c_str());
    ASSERT_TRUE(std::filesystem::exists(p));
    EXPECT_EQ(std::filesystem::file_size(p), 0u);
}

// ============================================================================
// Zeros
// ============================================================================

TEST_P(FilesWriterTest, WriteZerosProducesZeroFile) {
    CountingFileOps ops;
    FilesWriter w(FilesWriterConfig{GetParam()}, &ops);
    const std::string p = path("zeros");

    const int n = 3;
    for (int i = 0; i < n; ++i) {
        ASSERT_TRUE(is_ok(w.write_zeros(p.c_str())));
    }
    w.close(p.c_str());

    const std::vector<u8> content = read_all(p);
    EXPECT_EQ(content.size(), static_cast<size_t>(n) * kZeroBlockSize);
    EXPECT_TRUE(all_zero(content));
    EXPECT_EQ(ops.open_now.load(), 0);
}

TEST_P(FilesWriterTest, DataAfterZerosLandsAtEnd) {
    FilesWriter w(FilesWriterConfig{GetParam()});
    const std::string p = path("mixed");

    ASSERT_TRUE(is_ok(w.write_to_file(p.c_str(), view_of(bytes_of("head")))));
    ASSERT_TRUE(is_ok(w.write_zeros(p.c_str())));
    ASSERT_TRUE(is_ok(w.write_to_file(p.c_str(), view_of(bytes_of("tail")))));
    w.close(p.c_str());

    const std::vector<u8> content = read_all(p);
    ASSERT_EQ(content.size(), 8u + kZeroBlockSize);
    EXPECT_EQ(std::memcmp(content.data(), "head", 4), 0);
    EXPECT_TRUE(all_zero(std::vector<u8>(content.begin() + 4, content.end() - 4)));
    EXPECT_EQ(std::memcmp(content.data() + 4 + kZeroBlockSize, "tail", 4), 0);
}

TEST_P(FilesWriterTest, RefusedTruncateFallsBackToWrite) {
    RefusingTruncateFileOps ops(false);
    FilesWriter w(FilesWriterConfig{GetParam()}, &ops);
    const std::string p = path("fallback");

    const int n = 2;
    for (int i = 0; i < n; ++i) {
        WriteReport report{};
        ASSERT_TRUE(is_ok(w.write_zeros(p.c_str(), &report)));
        EXPECT_EQ(report.written_bytes, kZeroBlockSize);
    }
    ASSERT_TRUE(is_ok(w.write_to_file(p.c_str(), view_of(bytes_of("x")))));
    w.close(p.c_str());

    EXPECT_EQ(ops.truncates.load(), n);
    EXPECT_EQ(ops.writes.load(), n + 1);

    const std::vector<u8> content = read_all(p);
    ASSERT_EQ(content.size(), static_cast<size_t>(n) * kZeroBlockSize + 1);
    EXPECT_TRUE(all_zero(std::vector<u8>(content.begin(), content.end() - 1)));
    EXPECT_EQ(content.back(), 'x');
    EXPECT_EQ(ops.open_now.load(), 0);
}

TEST_P(FilesWriterTest, TruncateFailureAfterModificationIsFatal) {
    RefusingTruncateFileOps ops(true, EIO);
    FilesWriter w(FilesWriterConfig{GetParam()}, &ops);
    const std::string p = path("ambiguous");

    ASSERT_TRUE(is_ok(w.write_to_file(p.c_str(), view_of(bytes_of("abc")))));
    const Status s = w.write_zeros(p.c_str());
    EXPECT_EQ(s.code, StatusCode::Io);
    EXPECT_EQ(s.domain, StatusDomain::Restore);
    EXPECT_EQ(s.aux, static_cast<u32>(EIO));
    EXPECT_EQ(ops.writes.load(), 1);

    // The handle went back to the cache or was closed.
    EXPECT_LE(ops.open_now.load(), static_cast<int>(GetParam()));
    w.close(p.c_str());
    EXPECT_EQ(ops.open_now.load(), 0);
}

// ============================================================================
// Errors
// ============================================================================

TEST_P(FilesWriterTest, ShortWriteIsReported) {
    ShortWriteFileOps ops(4);
    FilesWriter w(FilesWriterConfig{GetParam()}, &ops);
    const std::string p = path("short");

    WriteReport report{};
    const Status s = w.write_to_file(p.c_str(), view_of(bytes_of("0123456789")), &report);
    EXPECT_EQ(s.code, StatusCode::ShortWrite);
    EXPECT_EQ(s.domain, StatusDomain::Restore);
    EXPECT_EQ(s.aux, 4u);
    EXPECT_EQ(report.expected_bytes, 10u);
    EXPECT_EQ(report.written_bytes, 4u);
    EXPECT_STREQ(report.path, p.c_str());

    char msg[1200];
    format_write_report(report, msg, sizeof(msg));
    const std::string expected = "error writing file " + p + ": wrong length written, want 10, got 4";
    EXPECT_EQ(std::string(msg), expected);

    EXPECT_LE(ops.open_now.load(), static_cast<int>(GetParam()));
    w.close(p.c_str());
    EXPECT_EQ(ops.open_now.load(), 0);
}

TEST_P(FilesWriterTest, ShortFallbackWriteIsReported) {
    class ShortNoTruncate : public ShortWriteFileOps {
    public:
        ShortNoTruncate() : ShortWriteFileOps(100) {}
        Status truncate(int, u64) noexcept override {
            return make_status(StatusDomain::Restore, StatusCode::Io, EPERM);
        }
    } ops;
    FilesWriter w(FilesWriterConfig{GetParam()}, &ops);
    const std::string p = path("short_zeros");

    WriteReport report{};
    const Status s = w.write_zeros(p.c_str(), &report);
    EXPECT_EQ(s.code, StatusCode::ShortWrite);
    EXPECT_EQ(report.expected_bytes, kZeroBlockSize);
    EXPECT_EQ(report.written_bytes, 100u);
    w.close(p.c_str());
    EXPECT_EQ(ops.open_now.load(), 0);
}

TEST_P(FilesWriterTest, OpenErrorIsReturnedUntouched) {
    FilesWriter w(FilesWriterConfig{GetParam()});
    const std::string p = path("no/such/dir/file");

    EXPECT_EQ(w.write_to_file(p.c_str(), view_of(bytes_of("x"))).code, StatusCode::NotFound);
    EXPECT_EQ(w.write_zeros(p.c_str()).code, StatusCode::NotFound);
    EXPECT_EQ(w.cache().cached_count(), 0u);
}

TEST_P(FilesWriterTest, WriteErrorReleasesHandle) {
    class FailingWrite : public CountingFileOps {
    public:
        Status write(int, BufferView, u64* written) noexcept override {
            *written = 0;
            return make_status(StatusDomain::Restore, StatusCode::Io, ENOSPC);
        }
    } ops;
    FilesWriter w(FilesWriterConfig{GetParam()}, &ops);
    const std::string p = path("nospace");

    const Status s = w.write_to_file(p.c_str(), view_of(bytes_of("data")));
    EXPECT_EQ(s.code, StatusCode::Io);
    EXPECT_EQ(s.aux, static_cast<u32>(ENOSPC));
    EXPECT_LE(ops.open_now.load(), static_cast<int>(GetParam()));
    w.close(p.c_str());
    EXPECT_EQ(ops.open_now.load(), 0);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_P(FilesWriterTest, OpenHandlesBoundedByInFlightPlusCapacity) {
    const u32 cap = GetParam();
    std::atomic<int> in_flight{0};
    CountingFileOps ops;
    ops.in_flight = &in_flight;
    ops.bound_slack = static_cast<int>(cap);
    FilesWriter w(FilesWriterConfig{cap}, &ops);

    const int threads = 8;
    const int files_per_thread = 6;
    const int writes_per_file = 20;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            for (int f = 0; f < files_per_thread; ++f) {
                const std::string p = path("t" + std::to_string(t) + "_f" + std::to_string(f));
                for (int i = 0; i < writes_per_file; ++i) {
                    const u8 b = static_cast<u8>('a' + (i % 26));
                    in_flight.fetch_add(1);
                    const Status s = w.write_to_file(p.c_str(), BufferView{&b, 1});
                    in_flight.fetch_sub(1);
                    EXPECT_TRUE(is_ok(s));
                    EXPECT_LE(w.cache().cached_count(), cap);
                }
                w.close(p.c_str());
            }
        });
    }
    for (std::thread& th : workers) {
        th.join();
    }

    EXPECT_EQ(ops.bound_violations.load(), 0);
    EXPECT_LE(ops.max_open.load(), threads + static_cast<int>(cap));
    EXPECT_EQ(ops.open_now.load(), 0);

    std::vector<u8> expected;
    for (int i = 0; i < writes_per_file; ++i) {
        expected.push_back(static_cast<u8>('a' + (i % 26)));
    }
    for (int t = 0; t < threads; ++t) {
        for (int f = 0; f < files_per_thread; ++f) {
            EXPECT_EQ(read_all(path("t" + std::to_string(t) + "_f" + std::to_string(f))), expected);
        }
    }
}

INSTANTIATE_TEST_SUITE_P(CacheCapacity, FilesWriterTest, ::testing::Values(0u, 1u, 4u));

// ============================================================================
// Scenarios
// ============================================================================

class FilesWriterScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = restor::test::make_temp_dir("files_writer_scenario");
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::string dir_;
};

TEST_F(FilesWriterScenarioTest, HelloWorldWithCapacityOne) {
    CountingFileOps ops;
    FilesWriter w(FilesWriterConfig{1}, &ops);
    const std::string a = dir_ + "/a";

    ASSERT_TRUE(is_ok(w.write_to_file(a.c_str(), view_of(bytes_of("hello")))));
    EXPECT_TRUE(w.cache().is_cached(a.c_str()));
    ASSERT_TRUE(is_ok(w.write_to_file(a.c_str(), view_of(bytes_of(" world")))));
    w.close(a.c_str());

    EXPECT_EQ(read_all(a), bytes_of("hello world"));
    EXPECT_EQ(ops.modes_for(a).size(), 1u);
    EXPECT_EQ(ops.open_now.load(), 0);
}

TEST_F(FilesWriterScenarioTest, TwoPathsConcurrentlyWithoutCache) {
    CountingFileOps ops;
    FilesWriter w(FilesWriterConfig{0}, &ops);
    const std::string a = dir_ + "/a";
    const std::string b = dir_ + "/b";

    Status sa{};
    Status sb{};
    std::thread ta([&] { sa = w.write_to_file(a.c_str(), view_of(bytes_of("alpha"))); });
    std::thread tb([&] { sb = w.write_to_file(b.c_str(), view_of(bytes_of("beta"))); });
    ta.join();
    tb.join();

    ASSERT_TRUE(is_ok(sa));
    ASSERT_TRUE(is_ok(sb));
    EXPECT_EQ(ops.open_now.load(), 0);
    EXPECT_EQ(w.cache().cached_count(), 0u);
    EXPECT_EQ(read_all(a), bytes_of("alpha"));
    EXPECT_EQ(read_all(b), bytes_of("beta"));
}
