#include <catch2/catch.hpp>
#include "backend/domain/catalog/VideoCollection.h"
#include "support/TestUtils.h"

using namespace testutil;

namespace {
VideoInfo makeVideo(const QString& id, const QString& status, double progress) {
    VideoInfo video;
    video.videoId = id;
    video.libraryId = "lib-1";
    video.filename = id + ".mp4";
    video.status = status;
    video.progress = progress;
    return video;
}
}

TEST_CASE("VideoCollection patches only the matching item", "[VideoCollection]") {
    VideoCollection videos;
    videos.replaceAll({makeVideo("a", "QUEUED", 0.0), makeVideo("b", "PROCESSING", 0.3), makeVideo("c", "DONE", 1.0)}, "lib-1");
    const QList<VideoInfo> before = videos.items();

    QList<int> patchedIndexes;
    QObject::connect(&videos, &VideoCollection::itemPatched, [&patchedIndexes](int index, const VideoInfo&) { patchedIndexes.append(index); });

    SECTION("job progress sets stage and progress") {
        REQUIRE(videos.applyJobEnvelope(envelope(jobProgressJson("job-b", "b", "EMBEDDING", 0.7))));
        const VideoInfo b = videos.item("b");
        CHECK(b.status == "EMBEDDING");
        CHECK(b.progress == Approx(0.7));
        CHECK(videos.item("a") == before.at(0));
        CHECK(videos.item("c") == before.at(2));
        CHECK(patchedIndexes == QList<int>{1});
    }

    SECTION("job progress without a stage keeps the status") {
        QJsonObject json = jobProgressJson("job-b", "b", QString(), 0.5);
        json.remove("stage");
        REQUIRE(videos.applyJobEnvelope(envelope(json)));
        CHECK(videos.item("b").status == "PROCESSING");
        CHECK(videos.item("b").progress == Approx(0.5));
    }

    SECTION("job complete marks the item done") {
        REQUIRE(videos.applyJobEnvelope(envelope(jobCompleteJson("job-a", "a"))));
        CHECK(videos.item("a").status == VIDEO_STATUS_DONE);
        CHECK(videos.item("a").progress == Approx(1.0));
        CHECK(videos.item("b") == before.at(1));
    }

    SECTION("job failed copies the error") {
        REQUIRE(videos.applyJobEnvelope(envelope(jobFailedJson("job-b", "b", "OOM", "out of memory"))));
        const VideoInfo b = videos.item("b");
        CHECK(b.status == VIDEO_STATUS_FAILED);
        CHECK(b.errorCode == "OOM");
        CHECK(b.errorMessage == "out of memory");
    }

    SECTION("unknown video ids are ignored") {
        CHECK_FALSE(videos.applyJobEnvelope(envelope(jobCompleteJson("job-z", "z"))));
        CHECK(videos.items() == before);
        CHECK(patchedIndexes.isEmpty());
    }

    SECTION("a progress frame without progress changes nothing") {
        CHECK_FALSE(videos.applyJobEnvelope(envelope(QJsonObject{{"type", "job_progress"}, {"job_id", "job-b"}, {"video_id", "b"}, {"stage", "X"}})));
        CHECK(videos.items() == before);
    }

    SECTION("patching never inserts items") {
        videos.applyJobEnvelope(envelope(jobCompleteJson("job-new", "new-video")));
        CHECK(videos.size() == 3);
        CHECK_FALSE(videos.contains("new-video"));
    }
}

TEST_CASE("VideoCollection replaces wholesale", "[VideoCollection]") {
    VideoCollection videos;
    int resets = 0;
    QObject::connect(&videos, &VideoCollection::collectionReset, [&resets]() { ++resets; });

    videos.replaceAll({makeVideo("a", "QUEUED", 0.0)}, "lib-1");
    videos.replaceAll({makeVideo("x", "DONE", 1.0), makeVideo("x", "QUEUED", 0.0)}, "lib-2");

    CHECK(resets == 2);
    CHECK(videos.libraryId() == "lib-2");
    CHECK_FALSE(videos.contains("a"));
    // Duplicate ids resolve to the first occurrence
    CHECK(videos.indexOf("x") == 0);

    videos.clear();
    CHECK(videos.isEmpty());
    CHECK(videos.libraryId().isEmpty());
}
