// ==============================================================================
// test_aggregator_gtest.cpp - Тесты сведения результатов (GoogleTest)
// ==============================================================================

#include "salvage/aggregator.hpp"

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

namespace salvage::scan::test {

using classify::Basis;
using classify::ClassificationResult;
using classify::Kind;

namespace {

/// Запоминает все события и снимки прогресса
class RecordingSink : public EventSink {
public:
    void on_event(const ScanEvent& event) override { events.push_back(event); }
    void on_progress(const ProgressState& state) override { snapshots.push_back(state); }

    std::vector<ScanEvent> events;
    std::vector<ProgressState> snapshots;
};

ClassificationResult match(const char* path, Kind kind, Basis basis = Basis::Extension) {
    ClassificationResult r;
    r.path = path;
    r.kind = kind;
    r.basis = basis;
    return r;
}

recover::CopyOutcome copy_outcome(const char* source, bool ok) {
    recover::CopyOutcome out;
    out.plan.source = source;
    out.plan.destination = std::string("/out/") + source;
    out.plan.kind = Kind::ProjectFile;
    out.succeeded = ok;
    if (!ok) {
        out.error_detail = "disk full";
    }
    return out;
}

}  // namespace

// ==============================================================================
// merge
// ==============================================================================

TEST(AggregatorTest, Merge_AddsCountsAndClearsBatch) {
    ResultAggregator agg;

    WorkerBatch batch;
    batch.examined = 10;
    batch.matches.push_back(match("/s/a.als", Kind::ProjectFile));
    batch.matches.push_back(match("/s/b.alp", Kind::ProjectArchive));
    batch.errors.push_back(ScanError{ErrorCategory::HeaderRead, "/s/c.dat", "denied"});

    agg.merge(batch);

    EXPECT_TRUE(batch.empty());
    auto state = agg.snapshot();
    EXPECT_EQ(state.files_examined, 10u);
    EXPECT_EQ(state.matches(Kind::ProjectFile), 1u);
    EXPECT_EQ(state.matches(Kind::ProjectArchive), 1u);
    EXPECT_EQ(state.matches(Kind::KeywordMatch), 0u);
    EXPECT_EQ(state.errors(ErrorCategory::HeaderRead), 1u);
    EXPECT_EQ(state.total_matches(), 2u);
    EXPECT_EQ(state.total_errors(), 1u);
}

TEST(AggregatorTest, Merge_EmptyBatch_NoProgressEvent) {
    RecordingSink sink;
    ResultAggregator agg(&sink);

    WorkerBatch batch;
    agg.merge(batch);

    EXPECT_TRUE(sink.snapshots.empty());
    EXPECT_TRUE(sink.events.empty());
}

TEST(AggregatorTest, Merge_EmitsMatchEventsThenProgress) {
    RecordingSink sink;
    ResultAggregator agg(&sink);

    WorkerBatch batch;
    batch.examined = 1;
    batch.matches.push_back(match("/s/old_backup.dat", Kind::ProjectFile, Basis::Header));
    agg.merge(batch);

    ASSERT_EQ(sink.events.size(), 1u);
    EXPECT_EQ(sink.events[0].type, EventType::Match);
    EXPECT_EQ(sink.events[0].kind, Kind::ProjectFile);
    EXPECT_EQ(sink.events[0].basis, Basis::Header);
    EXPECT_EQ(sink.events[0].path, std::filesystem::path("/s/old_backup.dat"));
    ASSERT_EQ(sink.snapshots.size(), 1u);
    EXPECT_EQ(sink.snapshots[0].files_examined, 1u);
}

TEST(AggregatorTest, ConcurrentMerges_NoLostUpdates) {
    constexpr int kThreads = 8;
    constexpr int kBatches = 200;
    ResultAggregator agg;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&agg, t] {
            for (int b = 0; b < kBatches; ++b) {
                WorkerBatch batch;
                batch.examined = 3;
                std::string path = "/s/t" + std::to_string(t) + "_" + std::to_string(b) + ".als";
                batch.matches.push_back(match(path.c_str(), Kind::ProjectFile));
                agg.merge(batch);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    auto state = agg.snapshot();
    EXPECT_EQ(state.files_examined, static_cast<std::uint64_t>(kThreads * kBatches * 3));
    EXPECT_EQ(state.matches(Kind::ProjectFile), static_cast<std::uint64_t>(kThreads * kBatches));
    EXPECT_EQ(agg.matches().size(), static_cast<size_t>(kThreads * kBatches));
}

TEST(AggregatorTest, ProgressSnapshots_NeverDecrease) {
    RecordingSink sink;
    ResultAggregator agg(&sink);

    for (int i = 0; i < 20; ++i) {
        WorkerBatch batch;
        batch.examined = 5;
        if (i % 3 == 0) {
            batch.matches.push_back(match(("/s/" + std::to_string(i) + ".als").c_str(),
                                          Kind::ProjectFile));
        }
        agg.merge(batch);
    }

    ASSERT_EQ(sink.snapshots.size(), 20u);
    for (size_t i = 1; i < sink.snapshots.size(); ++i) {
        EXPECT_GE(sink.snapshots[i].files_examined, sink.snapshots[i - 1].files_examined);
        EXPECT_GE(sink.snapshots[i].total_matches(), sink.snapshots[i - 1].total_matches());
    }
}

// ==============================================================================
// Ошибки, папки, копирование
// ==============================================================================

TEST(AggregatorTest, RecordError_CountedByCategoryAndEmitted) {
    RecordingSink sink;
    ResultAggregator agg(&sink);

    agg.record_error(ScanError{ErrorCategory::Enumeration, "/s/locked", "permission denied"});
    agg.record_error(ScanError{ErrorCategory::Planning, "/x/y.als", "outside"});

    auto state = agg.snapshot();
    EXPECT_EQ(state.errors(ErrorCategory::Enumeration), 1u);
    EXPECT_EQ(state.errors(ErrorCategory::Planning), 1u);
    ASSERT_EQ(sink.events.size(), 2u);
    EXPECT_EQ(sink.events[0].type, EventType::Error);
    EXPECT_EQ(sink.events[0].category, ErrorCategory::Enumeration);
    EXPECT_EQ(sink.events[0].detail, "permission denied");
}

TEST(AggregatorTest, RecordProjectFolder_Counted) {
    RecordingSink sink;
    ResultAggregator agg(&sink);

    agg.record_project_folder("/s/My Project");

    EXPECT_EQ(agg.snapshot().project_folders_seen, 1u);
    ASSERT_EQ(sink.events.size(), 1u);
    EXPECT_EQ(sink.events[0].type, EventType::ProjectFolder);
}

TEST(AggregatorTest, RecordCopy_SuccessAndFailure) {
    RecordingSink sink;
    ResultAggregator agg(&sink);

    agg.record_copy(copy_outcome("/s/b.als", true));
    agg.record_copy(copy_outcome("/s/a.als", false));

    auto state = agg.snapshot();
    EXPECT_EQ(state.copies_succeeded, 1u);
    EXPECT_EQ(state.copies_failed, 1u);
    EXPECT_EQ(state.errors(ErrorCategory::Copy), 1u);

    ASSERT_EQ(sink.events.size(), 2u);
    EXPECT_EQ(sink.events[0].type, EventType::Copied);
    EXPECT_EQ(sink.events[0].detail, "/out//s/b.als");
    EXPECT_EQ(sink.events[1].type, EventType::Error);
    EXPECT_EQ(sink.events[1].category, ErrorCategory::Copy);
    EXPECT_EQ(sink.events[1].detail, "disk full");

    auto copies = agg.copies();
    ASSERT_EQ(copies.size(), 2u);
    EXPECT_EQ(copies[0].plan.source, std::filesystem::path("/s/a.als"));
    EXPECT_EQ(copies[1].plan.source, std::filesystem::path("/s/b.als"));
}

TEST(AggregatorTest, Matches_SortedByPath) {
    ResultAggregator agg;

    WorkerBatch batch;
    batch.examined = 3;
    batch.matches.push_back(match("/s/c.als", Kind::ProjectFile));
    batch.matches.push_back(match("/s/a.als", Kind::ProjectFile));
    batch.matches.push_back(match("/s/b.alp", Kind::ProjectArchive));
    agg.merge(batch);

    auto m = agg.matches();
    ASSERT_EQ(m.size(), 3u);
    EXPECT_EQ(m[0].path, std::filesystem::path("/s/a.als"));
    EXPECT_EQ(m[1].path, std::filesystem::path("/s/b.alp"));
    EXPECT_EQ(m[2].path, std::filesystem::path("/s/c.als"));
}

TEST(AggregatorTest, SetPhase_EmitsPhaseChanged) {
    RecordingSink sink;
    ResultAggregator agg(&sink);

    agg.set_phase(Phase::Copying);

    ASSERT_EQ(sink.events.size(), 1u);
    EXPECT_EQ(sink.events[0].type, EventType::PhaseChanged);
    EXPECT_EQ(sink.events[0].phase, Phase::Copying);
}

TEST(AggregatorTest, CategoryNames_Stable) {
    EXPECT_STREQ(error_category_to_string(ErrorCategory::Enumeration), "enumeration");
    EXPECT_STREQ(error_category_to_string(ErrorCategory::HeaderRead), "header_read");
    EXPECT_STREQ(error_category_to_string(ErrorCategory::Copy), "copy");
    EXPECT_STREQ(event_type_to_string(EventType::Match), "match");
}

}  // namespace salvage::scan::test
