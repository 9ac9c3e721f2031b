/**
 * @file job_scheduler.h
 * @brief Background job execution with backpressure and cooperative cancellation
 *
 * Architecture:
 * - submit() never blocks. It either queues the job or rejects it when the
 *   number of outstanding jobs (queued + running) has reached the limit, or
 *   when the scheduler is not running.
 * - A dispatcher thread hands pending jobs to JobWorkers according to the
 *   threading mode:
 *     INLINE      one worker, jobs run one after another
 *     FIXED_POOL  N workers, round-robin assignment
 *     ADAPTIVE    first idle worker; if none is idle the dispatcher runs the
 *                 job itself instead of queuing further
 * - Every job receives a token linked from its own cancel flag and the
 *   scheduler-wide shutdown flag.
 * - An exception escaping a job marks it FAILED and retires the worker that
 *   ran it; the dispatcher replaces retired workers.
 * - The threading mode and pool size can change while running. On every
 *   wake the dispatcher spawns workers up to the target, or retires idle
 *   ones beyond it; a busy worker is retired after its current job.
 *
 * Thread Safety:
 *   All public methods are thread-safe. Event listeners run on worker or
 *   dispatcher threads, with no ordering across unrelated jobs.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "cancellation.h"

enum class ThreadingMode {
    INLINE,
    FIXED_POOL,
    ADAPTIVE
};

const char* threadingModeToString(ThreadingMode mode);

enum class JobStatus {
    QUEUED,
    RUNNING,
    COMPLETED,
    CANCELED,
    FAILED
};

const char* jobStatusToString(JobStatus status);

enum class JobEvent {
    QUEUED,
    STARTED,
    FINISHED
};

/**
 * @brief Unit of background work
 */
class Job {
public:
    virtual ~Job() = default;

    /**
     * @brief Runs the job
     *
     * Long-running jobs poll the token and return early when canceled.
     *
     * @return True if the job ran to completion, false if it stopped because
     *         of cancellation
     */
    virtual bool execute(const CancellationToken& cancel) = 0;

    virtual const char* name() const { return "job"; }
};

/**
 * @brief Job that publishes a single heap-allocated result on completion
 *
 * The result is only visible after execute() returned true.
 */
template <typename Result>
class ResultJob : public Job {
public:
    /// Hands the result to the caller (null if the job did not complete)
    std::unique_ptr<Result> takeResult() {
        std::lock_guard<std::mutex> lock(m_resultMutex);
        return std::move(m_result);
    }

    bool hasResult() const {
        std::lock_guard<std::mutex> lock(m_resultMutex);
        return m_result != nullptr;
    }

protected:
    void publish(std::unique_ptr<Result> result) {
        std::lock_guard<std::mutex> lock(m_resultMutex);
        m_result = std::move(result);
    }

private:
    mutable std::mutex m_resultMutex;
    std::unique_ptr<Result> m_result;
};

/**
 * @brief Bookkeeping shared by the scheduler and every handle to one job
 */
class JobState {
public:
    JobState(uint64_t id, std::shared_ptr<Job> job);

    uint64_t id() const { return m_id; }
    const std::shared_ptr<Job>& job() const { return m_job; }

    JobStatus status() const { return m_status.load(std::memory_order_acquire); }
    bool isFinished() const;

    void setStatus(JobStatus status);

    void requestCancel() { m_cancel.requestCancel(); }
    bool isCancellationRequested() const { return m_cancel.isCancellationRequested(); }
    CancellationToken token() const { return m_cancel.token(); }

    JobStatus wait() const;
    bool waitFor(std::chrono::milliseconds timeout) const;

    void setError(const std::string& message);
    std::string error() const;

private:
    const uint64_t m_id;
    std::shared_ptr<Job> m_job;
    CancellationSource m_cancel;
    std::atomic<JobStatus> m_status;

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_finishedCV;
    std::string m_error;
};

/**
 * @brief Caller's view of a submitted job
 */
class JobHandle {
public:
    JobHandle() = default;

    bool valid() const { return m_state != nullptr; }
    uint64_t id() const { return m_state ? m_state->id() : 0; }
    JobStatus status() const;

    /// True once the job completed, was canceled, or failed
    bool isFinished() const { return m_state && m_state->isFinished(); }

    /// Requests cooperative cancellation
    void cancel() const;

    /// Blocks until the job finishes
    JobStatus wait() const;

    /// @return True if the job finished within the timeout
    bool waitFor(std::chrono::milliseconds timeout) const;

    /// Failure message of a FAILED job
    std::string error() const { return m_state ? m_state->error() : std::string(); }

    std::shared_ptr<Job> job() const { return m_state ? m_state->job() : nullptr; }

    template <typename T>
    std::shared_ptr<T> jobAs() const { return std::dynamic_pointer_cast<T>(job()); }

private:
    friend class JobScheduler;
    explicit JobHandle(std::shared_ptr<JobState> state) : m_state(std::move(state)) {}

    std::shared_ptr<JobState> m_state;
};

/**
 * @brief Thread with a private job queue
 *
 * The run function returns false when the worker must retire (the job threw).
 */
class JobWorker {
public:
    using RunFunction = std::function<bool(const std::shared_ptr<JobState>&)>;

    JobWorker(int index, RunFunction run, std::chrono::milliseconds waitTimeout);
    ~JobWorker();

    JobWorker(const JobWorker&) = delete;
    JobWorker& operator=(const JobWorker&) = delete;

    void enqueue(std::shared_ptr<JobState> state);

    /// Removes and returns jobs not yet started
    std::vector<std::shared_ptr<JobState>> drain();

    /// Not processing and nothing queued
    bool isIdle() const;
    bool isProcessing() const { return m_processing.load(); }
    bool isRetired() const { return m_retired.load(); }
    int index() const { return m_index; }

    /// Signals the loop to exit and joins the thread
    void stop();

private:
    void loop();

    const int m_index;
    RunFunction m_run;
    std::chrono::milliseconds m_waitTimeout;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::shared_ptr<JobState>> m_queue;

    std::atomic<bool> m_processing{false};
    std::atomic<bool> m_retired{false};
    std::atomic<bool> m_stopping{false};
    std::thread m_thread;
};

struct SchedulerOptions {
    ThreadingMode mode = ThreadingMode::ADAPTIVE;
    int workers = 0;                  ///< <= 0: hardware_concurrency - 1 (at least 1)
    size_t maxQueuedJobs = 256;       ///< Limit on queued + running jobs; 0 = unbounded
    std::chrono::milliseconds waitTimeout{10};
};

struct SchedulerCounters {
    uint64_t submitted = 0;
    uint64_t rejected = 0;
    uint64_t completed = 0;
    uint64_t canceled = 0;
    uint64_t failed = 0;
    uint64_t workersRetired = 0;
};

class JobScheduler {
public:
    using EventListener = std::function<void(JobEvent, const JobHandle&)>;
    using WorkerCountListener = std::function<void(size_t previous, size_t current)>;

    explicit JobScheduler(SchedulerOptions options = SchedulerOptions());
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    /**
     * @brief Spawns the dispatcher and workers
     */
    void start();

    /**
     * @brief Cancels every outstanding job and joins all threads
     *
     * Jobs that never started are marked CANCELED.
     */
    void shutdown();

    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Queues a job
     *
     * @param job Job to run
     * @param handle Set to the job's handle on success
     * @return False if rejected (limit reached or not running); counters are
     *         left unchanged
     */
    bool submit(std::shared_ptr<Job> job, JobHandle& handle);

    /**
     * @brief Requests cancellation of a job
     * @return False if the handle is invalid or the job already finished
     */
    bool cancel(const JobHandle& handle);

    /// Jobs waiting to start
    size_t queueDepth() const { return m_queued.load(); }

    /// Jobs currently executing
    size_t activeCount() const { return m_active.load(); }

    /// Queued + running
    size_t jobCount() const { return m_queued.load() + m_active.load(); }

    size_t workerCount() const;

    /// Worker count the dispatcher converges to (1 in INLINE mode)
    size_t targetWorkerCount() const;

    ThreadingMode mode() const { return m_mode.load(); }

    /**
     * @brief Switches the dispatch policy
     *
     * Applies to jobs dispatched from now on. Entering INLINE shrinks the
     * pool to one worker; leaving it grows the pool back to the configured
     * size.
     */
    void setThreadingMode(ThreadingMode mode);

    /**
     * @brief Sets the pool size for FIXED_POOL and ADAPTIVE (at least 1)
     */
    void setWorkerCount(int count);

    const SchedulerOptions& options() const { return m_options; }
    SchedulerCounters counters() const;

    /// Token canceled when the scheduler shuts down
    CancellationToken shutdownToken() const { return m_shutdown.token(); }

    /**
     * @brief Installs a listener for job lifecycle events
     *
     * Set before start(); the listener may run on any scheduler thread.
     */
    void setEventListener(EventListener listener);

    /**
     * @brief Installs a listener called when workers are spawned or retired
     *
     * Set before start(); runs on the dispatcher thread.
     */
    void setWorkerCountListener(WorkerCountListener listener);

private:
    void dispatcherLoop();
    void dispatch(std::shared_ptr<JobState> state);
    void replaceRetiredWorkers();
    void adjustWorkerCount();
    JobWorker* selectWorker();

    /// Runs one job; returns false if it threw
    bool runJob(const std::shared_ptr<JobState>& state);

    void onEvent(JobEvent event, const std::shared_ptr<JobState>& state);
    void finishUnstarted(const std::shared_ptr<JobState>& state);

    std::unique_ptr<JobWorker> createWorker(int index);

    SchedulerOptions m_options;
    std::atomic<ThreadingMode> m_mode;
    std::atomic<int> m_poolSize{1};   ///< Workers outside INLINE mode

    std::atomic<bool> m_running{false};
    CancellationSource m_shutdown;

    // Submitted jobs not yet handed to a worker
    mutable std::mutex m_pendingMutex;
    std::condition_variable m_pendingCV;
    std::deque<std::shared_ptr<JobState>> m_pending;

    // Owned by the dispatcher thread while running
    mutable std::mutex m_workersMutex;
    std::vector<std::unique_ptr<JobWorker>> m_workers;
    size_t m_nextWorker = 0;
    std::thread m_dispatcher;

    std::atomic<size_t> m_queued{0};
    std::atomic<size_t> m_active{0};
    std::atomic<uint64_t> m_nextJobId{1};

    std::atomic<uint64_t> m_submitted{0};
    std::atomic<uint64_t> m_rejected{0};
    std::atomic<uint64_t> m_completed{0};
    std::atomic<uint64_t> m_canceled{0};
    std::atomic<uint64_t> m_failed{0};
    std::atomic<uint64_t> m_workersRetired{0};

    EventListener m_listener;
    WorkerCountListener m_workerCountListener;
};
