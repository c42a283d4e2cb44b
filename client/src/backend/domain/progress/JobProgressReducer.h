#ifndef JOBPROGRESSREDUCER_H
#define JOBPROGRESSREDUCER_H

#include "backend/domain/progress/ProgressReducer.h"

/**
 * @brief Processing jobs keyed by job_id
 *
 * Holds the latest job_progress, job_complete or job_failed per job. Entries
 * live until clear(); the map is bounded by the jobs seen in one session.
 */
class JobProgressReducer : public ProgressReducer {
    Q_OBJECT

public:
    explicit JobProgressReducer(QObject* parent = nullptr);
    ~JobProgressReducer() override = default;

    bool apply(const Envelope& envelope) override;
    void clear() override;

    /**
     * @brief Latest job envelope that targeted a video
     * @return false when no job for the video has been seen
     */
    bool latestForVideo(const QString& videoId, Envelope* envelope) const;

signals:
    void jobTransition(const Envelope& envelope);

private:
    QHash<QString, QString> m_latestJobByVideo;   // video_id -> job_id
};

#endif // JOBPROGRESSREDUCER_H
