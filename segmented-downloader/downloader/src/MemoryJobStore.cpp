// =============================================================================
// MemoryJobStore.cpp
// =============================================================================

#include "MemoryJobStore.h"

#include <algorithm>
#include <stdexcept>

namespace SegmentedDownloader {

const char* toString(JobState state) {
    switch (state) {
    case JobState::QUEUED:    return "queued";
    case JobState::RUNNING:   return "running";
    case JobState::PAUSED:    return "paused";
    case JobState::ERROR:     return "error";
    case JobState::COMPLETED: return "completed";
    }
    return "unknown";
}

JobId MemoryJobStore::addJob(const std::string& url, const JobSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    Job job;
    job.id       = nextId_++;
    job.url      = url;
    job.settings = settings;
    job.state    = JobState::QUEUED;
    jobs_[job.id] = job;
    return job.id;
}

void MemoryJobStore::put(const Job& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_[job.id] = job;
    nextId_ = std::max(nextId_, job.id + 1);
}

std::optional<Job> MemoryJobStore::claimNextQueued() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : jobs_) {
        if (entry.second.state == JobState::QUEUED) {
            entry.second.state = JobState::RUNNING;
            return entry.second;
        }
    }
    return std::nullopt;
}

void MemoryJobStore::updateMetadata(JobId id, const JobMetadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    at(id).metadata = metadata;
}

void MemoryJobStore::updateBitmap(JobId id, const std::vector<uint8_t>& bitmap) {
    std::lock_guard<std::mutex> lock(mutex_);
    at(id).metadata.completedBitmap = bitmap;
}

void MemoryJobStore::setState(JobId id, JobState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    at(id).state = state;
}

Job MemoryJobStore::get(JobId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return at(id);
}

std::vector<Job> MemoryJobStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> jobs;
    jobs.reserve(jobs_.size());
    for (const auto& entry : jobs_) {
        jobs.push_back(entry.second);
    }
    return jobs;
}

size_t MemoryJobStore::recoverStaleRunning() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t recovered = 0;
    for (auto& entry : jobs_) {
        if (entry.second.state == JobState::RUNNING) {
            entry.second.state = JobState::QUEUED;
            ++recovered;
        }
    }
    return recovered;
}

Job& MemoryJobStore::at(JobId id) {
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        throw std::out_of_range("unknown job id " + std::to_string(id));
    }
    return it->second;
}

const Job& MemoryJobStore::at(JobId id) const {
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        throw std::out_of_range("unknown job id " + std::to_string(id));
    }
    return it->second;
}

} // namespace SegmentedDownloader
