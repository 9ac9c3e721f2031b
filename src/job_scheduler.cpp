/**
 * @file job_scheduler.cpp
 * @brief Dispatcher, worker loops and job bookkeeping
 */

#include "job_scheduler.h"
#include "logger.h"

#include <algorithm>

namespace {
const char* LOG_CHANNEL = "JobScheduler";
}

const char* threadingModeToString(ThreadingMode mode) {
    switch (mode) {
        case ThreadingMode::INLINE: return "inline";
        case ThreadingMode::FIXED_POOL: return "fixed";
        case ThreadingMode::ADAPTIVE: return "adaptive";
    }
    return "unknown";
}

const char* jobStatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::QUEUED: return "queued";
        case JobStatus::RUNNING: return "running";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::CANCELED: return "canceled";
        case JobStatus::FAILED: return "failed";
    }
    return "unknown";
}

// ========== JobState ==========

JobState::JobState(uint64_t id, std::shared_ptr<Job> job)
    : m_id(id)
    , m_job(std::move(job))
    , m_status(JobStatus::QUEUED) {
}

bool JobState::isFinished() const {
    JobStatus current = status();
    return current == JobStatus::COMPLETED || current == JobStatus::CANCELED || current == JobStatus::FAILED;
}

void JobState::setStatus(JobStatus status) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_status.store(status, std::memory_order_release);
    }
    if (isFinished()) {
        m_finishedCV.notify_all();
    }
}

JobStatus JobState::wait() const {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_finishedCV.wait(lock, [this]() { return isFinished(); });
    return status();
}

bool JobState::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_finishedCV.wait_for(lock, timeout, [this]() { return isFinished(); });
}

void JobState::setError(const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_error = message;
}

std::string JobState::error() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_error;
}

// ========== JobHandle ==========

JobStatus JobHandle::status() const {
    return m_state ? m_state->status() : JobStatus::FAILED;
}

void JobHandle::cancel() const {
    if (m_state) {
        m_state->requestCancel();
    }
}

JobStatus JobHandle::wait() const {
    return m_state ? m_state->wait() : JobStatus::FAILED;
}

bool JobHandle::waitFor(std::chrono::milliseconds timeout) const {
    return m_state ? m_state->waitFor(timeout) : true;
}

// ========== JobWorker ==========

JobWorker::JobWorker(int index, RunFunction run, std::chrono::milliseconds waitTimeout)
    : m_index(index)
    , m_run(std::move(run))
    , m_waitTimeout(waitTimeout) {
    m_thread = std::thread(&JobWorker::loop, this);
}

JobWorker::~JobWorker() {
    stop();
}

void JobWorker::enqueue(std::shared_ptr<JobState> state) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push_back(std::move(state));
    }
    m_cv.notify_one();
}

std::vector<std::shared_ptr<JobState>> JobWorker::drain() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::shared_ptr<JobState>> remaining(m_queue.begin(), m_queue.end());
    m_queue.clear();
    return remaining;
}

bool JobWorker::isIdle() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_processing.load() && !m_retired.load() && m_queue.empty();
}

void JobWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping.store(true);
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void JobWorker::loop() {
    Logger::debug(LOG_CHANNEL) << "Worker " << m_index << " started (ID: " << std::this_thread::get_id() << ")";

    while (true) {
        std::shared_ptr<JobState> state;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait_for(lock, m_waitTimeout, [this]() {
                return !m_queue.empty() || m_stopping.load();
            });

            if (m_stopping.load()) {
                break;
            }
            if (m_queue.empty()) {
                continue;
            }

            state = std::move(m_queue.front());
            m_queue.pop_front();
            m_processing.store(true);
        }

        bool keepRunning = m_run(state);
        m_processing.store(false);

        if (!keepRunning) {
            m_retired.store(true);
            Logger::warning(LOG_CHANNEL) << "Worker " << m_index << " retired after job " << state->id() << " failed";
            break;
        }
    }

    Logger::debug(LOG_CHANNEL) << "Worker " << m_index << " exiting";
}

// ========== JobScheduler ==========

JobScheduler::JobScheduler(SchedulerOptions options)
    : m_options(options)
    , m_mode(options.mode) {
    if (m_options.workers > 0) {
        m_poolSize = m_options.workers;
    } else {
        m_poolSize = std::max(1, static_cast<int>(std::thread::hardware_concurrency()) - 1);
    }
}

JobScheduler::~JobScheduler() {
    shutdown();
}

std::unique_ptr<JobWorker> JobScheduler::createWorker(int index) {
    return std::make_unique<JobWorker>(
        index,
        [this](const std::shared_ptr<JobState>& state) { return runJob(state); },
        m_options.waitTimeout);
}

void JobScheduler::start() {
    if (m_running.load()) {
        Logger::warning(LOG_CHANNEL) << "JobScheduler already running";
        return;
    }

    m_shutdown = CancellationSource();

    {
        std::lock_guard<std::mutex> lock(m_workersMutex);
        const int target = static_cast<int>(targetWorkerCount());
        for (int i = 0; i < target; ++i) {
            m_workers.push_back(createWorker(i));
        }
        m_nextWorker = 0;
    }

    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        m_running.store(true);
    }
    m_dispatcher = std::thread(&JobScheduler::dispatcherLoop, this);

    Logger::info(LOG_CHANNEL) << "Started (" << threadingModeToString(mode()) << ", "
                              << targetWorkerCount() << " workers, max queued "
                              << m_options.maxQueuedJobs << ")";
}

void JobScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        if (!m_running.load()) {
            return;
        }
        m_running.store(false);
    }

    Logger::info(LOG_CHANNEL) << "Stopping...";

    m_shutdown.requestCancel();
    m_pendingCV.notify_all();

    if (m_dispatcher.joinable()) {
        m_dispatcher.join();
    }

    std::vector<std::shared_ptr<JobState>> unstarted;
    {
        std::lock_guard<std::mutex> lock(m_workersMutex);
        for (auto& worker : m_workers) {
            worker->stop();
            std::vector<std::shared_ptr<JobState>> remaining = worker->drain();
            unstarted.insert(unstarted.end(), remaining.begin(), remaining.end());
        }
        m_workers.clear();
    }
    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        unstarted.insert(unstarted.end(), m_pending.begin(), m_pending.end());
        m_pending.clear();
    }

    for (const auto& state : unstarted) {
        finishUnstarted(state);
    }

    Logger::info(LOG_CHANNEL) << "Stopped (" << unstarted.size() << " queued jobs canceled)";
}

bool JobScheduler::submit(std::shared_ptr<Job> job, JobHandle& handle) {
    if (!job) {
        return false;
    }

    std::shared_ptr<JobState> state;
    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        if (!m_running.load()) {
            m_rejected++;
            Logger::debug(LOG_CHANNEL) << "Rejected " << job->name() << ": scheduler not running";
            return false;
        }
        if (m_options.maxQueuedJobs > 0 && jobCount() >= m_options.maxQueuedJobs) {
            m_rejected++;
            Logger::debug(LOG_CHANNEL) << "Rejected " << job->name() << ": " << jobCount()
                                       << " jobs outstanding (limit " << m_options.maxQueuedJobs << ")";
            return false;
        }

        state = std::make_shared<JobState>(m_nextJobId++, std::move(job));
        m_queued++;
        m_submitted++;
    }

    // QUEUED fires before the dispatcher can see the job
    handle = JobHandle(state);
    onEvent(JobEvent::QUEUED, state);

    bool stopped = false;
    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        if (m_running.load()) {
            m_pending.push_back(state);
        } else {
            stopped = true;
        }
    }

    if (stopped) {
        // Shut down between accepting and queuing
        finishUnstarted(state);
    } else {
        m_pendingCV.notify_one();
    }
    return true;
}

bool JobScheduler::cancel(const JobHandle& handle) {
    if (!handle.valid() || handle.isFinished()) {
        return false;
    }
    handle.cancel();
    return true;
}

size_t JobScheduler::workerCount() const {
    std::lock_guard<std::mutex> lock(m_workersMutex);
    return m_workers.size();
}

size_t JobScheduler::targetWorkerCount() const {
    if (m_mode.load() == ThreadingMode::INLINE) {
        return 1;
    }
    return static_cast<size_t>(m_poolSize.load());
}

void JobScheduler::setThreadingMode(ThreadingMode mode) {
    const ThreadingMode previous = m_mode.exchange(mode);
    if (previous == mode) {
        return;
    }
    Logger::info(LOG_CHANNEL) << "Threading mode " << threadingModeToString(previous) << " -> "
                              << threadingModeToString(mode);
    m_pendingCV.notify_one();
}

void JobScheduler::setWorkerCount(int count) {
    count = std::max(1, count);
    const int previous = m_poolSize.exchange(count);
    if (previous == count) {
        return;
    }
    Logger::info(LOG_CHANNEL) << "Worker target " << previous << " -> " << count;
    m_pendingCV.notify_one();
}

SchedulerCounters JobScheduler::counters() const {
    SchedulerCounters counters;
    counters.submitted = m_submitted.load();
    counters.rejected = m_rejected.load();
    counters.completed = m_completed.load();
    counters.canceled = m_canceled.load();
    counters.failed = m_failed.load();
    counters.workersRetired = m_workersRetired.load();
    return counters;
}

void JobScheduler::setEventListener(EventListener listener) {
    m_listener = std::move(listener);
}

void JobScheduler::setWorkerCountListener(WorkerCountListener listener) {
    m_workerCountListener = std::move(listener);
}

void JobScheduler::dispatcherLoop() {
    Logger::debug(LOG_CHANNEL) << "Dispatcher started";

    while (true) {
        std::shared_ptr<JobState> state;
        {
            std::unique_lock<std::mutex> lock(m_pendingMutex);
            m_pendingCV.wait_for(lock, m_options.waitTimeout, [this]() {
                return !m_pending.empty() || !m_running.load();
            });

            if (!m_running.load()) {
                break;
            }
            if (!m_pending.empty()) {
                state = std::move(m_pending.front());
                m_pending.pop_front();
            }
        }

        replaceRetiredWorkers();
        adjustWorkerCount();
        if (state) {
            dispatch(std::move(state));
        }
    }

    Logger::debug(LOG_CHANNEL) << "Dispatcher exiting";
}

void JobScheduler::dispatch(std::shared_ptr<JobState> state) {
    // Already canceled: finish it here without occupying a worker
    if (state->isCancellationRequested()) {
        runJob(state);
        return;
    }

    JobWorker* worker = selectWorker();
    if (worker) {
        worker->enqueue(std::move(state));
        return;
    }

    // ADAPTIVE with every worker busy: run on the dispatcher thread
    if (!runJob(state)) {
        Logger::warning(LOG_CHANNEL) << "Job " << state->id() << " failed on the dispatcher thread";
    }
}

JobWorker* JobScheduler::selectWorker() {
    std::lock_guard<std::mutex> lock(m_workersMutex);
    if (m_workers.empty()) {
        return nullptr;
    }

    if (m_mode.load() == ThreadingMode::ADAPTIVE) {
        for (auto& worker : m_workers) {
            if (worker->isIdle()) {
                return worker.get();
            }
        }
        return nullptr;
    }

    // INLINE and FIXED_POOL: round-robin over live workers
    for (size_t attempt = 0; attempt < m_workers.size(); ++attempt) {
        JobWorker* worker = m_workers[m_nextWorker % m_workers.size()].get();
        m_nextWorker = (m_nextWorker + 1) % m_workers.size();
        if (!worker->isRetired()) {
            return worker;
        }
    }
    return nullptr;
}

void JobScheduler::replaceRetiredWorkers() {
    std::lock_guard<std::mutex> lock(m_workersMutex);
    for (auto& worker : m_workers) {
        if (!worker->isRetired()) {
            continue;
        }

        // Give its unstarted jobs back to the dispatcher, oldest first
        std::vector<std::shared_ptr<JobState>> remaining = worker->drain();
        if (!remaining.empty()) {
            std::lock_guard<std::mutex> pendingLock(m_pendingMutex);
            m_pending.insert(m_pending.begin(), remaining.begin(), remaining.end());
        }

        const int index = worker->index();
        worker->stop();
        worker = createWorker(index);
        m_workersRetired++;
        Logger::info(LOG_CHANNEL) << "Replaced retired worker " << index;
    }
}

void JobScheduler::adjustWorkerCount() {
    const size_t target = targetWorkerCount();
    size_t previous = 0;
    size_t current = 0;
    std::vector<std::unique_ptr<JobWorker>> retiring;
    {
        std::lock_guard<std::mutex> lock(m_workersMutex);
        previous = m_workers.size();
        while (m_workers.size() < target) {
            m_workers.push_back(createWorker(static_cast<int>(m_workers.size())));
        }
        // Retire from the back; a worker running a job is left for a later wake
        while (m_workers.size() > target && !m_workers.back()->isProcessing()) {
            retiring.push_back(std::move(m_workers.back()));
            m_workers.pop_back();
        }
        current = m_workers.size();
    }

    if (previous == current) {
        return;
    }

    // Stopped outside the lock: a worker that picked up a job just before
    // stop() finishes it first
    std::vector<std::shared_ptr<JobState>> returned;
    for (auto& worker : retiring) {
        worker->stop();
        std::vector<std::shared_ptr<JobState>> remaining = worker->drain();
        returned.insert(returned.end(), remaining.begin(), remaining.end());
    }
    if (!returned.empty()) {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        m_pending.insert(m_pending.begin(), returned.begin(), returned.end());
    }

    Logger::info(LOG_CHANNEL) << "Workers " << previous << " -> " << current << " ("
                              << returned.size() << " queued jobs returned)";
    if (m_workerCountListener) {
        m_workerCountListener(previous, current);
    }
}

bool JobScheduler::runJob(const std::shared_ptr<JobState>& state) {
    onEvent(JobEvent::STARTED, state);
    state->setStatus(JobStatus::RUNNING);

    const CancellationToken token = state->token().linkedWith(m_shutdown.token());

    JobStatus result = JobStatus::CANCELED;
    bool threw = false;
    if (!token.isCancellationRequested()) {
        try {
            result = state->job()->execute(token) ? JobStatus::COMPLETED : JobStatus::CANCELED;
        } catch (const std::exception& e) {
            Logger::error(LOG_CHANNEL) << "Job " << state->id() << " (" << state->job()->name()
                                       << ") threw: " << e.what();
            state->setError(e.what());
            result = JobStatus::FAILED;
            threw = true;
        } catch (...) {
            Logger::error(LOG_CHANNEL) << "Job " << state->id() << " (" << state->job()->name()
                                       << ") threw a non-standard exception";
            state->setError("unknown exception");
            result = JobStatus::FAILED;
            threw = true;
        }
    }

    // Counters settle before waiters wake
    m_active--;
    switch (result) {
        case JobStatus::COMPLETED: m_completed++; break;
        case JobStatus::CANCELED: m_canceled++; break;
        default: m_failed++; break;
    }
    state->setStatus(result);
    onEvent(JobEvent::FINISHED, state);

    return !threw;
}

void JobScheduler::onEvent(JobEvent event, const std::shared_ptr<JobState>& state) {
    if (event == JobEvent::STARTED) {
        // Increment first so jobCount() never dips during the handoff
        m_active++;
        m_queued--;
    }

    if (m_listener) {
        m_listener(event, JobHandle(state));
    }
}

void JobScheduler::finishUnstarted(const std::shared_ptr<JobState>& state) {
    m_queued--;
    m_canceled++;
    state->setStatus(JobStatus::CANCELED);
    onEvent(JobEvent::FINISHED, state);
}
