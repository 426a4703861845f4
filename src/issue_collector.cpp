#include "core/issue_collector.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

IssueCollector::IssueCollector()
{
    for (auto &counter : category_counts_)
    {
        counter.store(0);
    }
    for (auto &counter : severity_counts_)
    {
        counter.store(0);
    }
}

void IssueCollector::submit(IssueRecord record)
{
    if (finalized_.load())
    {
        throw std::logic_error("IssueCollector: submit after finalize");
    }

    tally(record);
    local_buffers_.local().push_back(std::move(record));
}

void IssueCollector::submitAll(std::vector<IssueRecord> records)
{
    if (records.empty())
    {
        return;
    }
    if (finalized_.load())
    {
        throw std::logic_error("IssueCollector: submit after finalize");
    }

    for (const auto &record : records)
    {
        tally(record);
    }

    auto &buffer = local_buffers_.local();
    buffer.insert(buffer.end(),
                  std::make_move_iterator(records.begin()),
                  std::make_move_iterator(records.end()));
}

std::vector<IssueRecord> IssueCollector::finalize()
{
    std::lock_guard<std::mutex> lock(finalize_mutex_);
    if (finalized_.exchange(true))
    {
        throw std::logic_error("IssueCollector: finalize called more than once");
    }

    std::vector<IssueRecord> merged;
    merged.reserve(total_.load());

    for (auto &buffer : local_buffers_)
    {
        merged.insert(merged.end(),
                      std::make_move_iterator(buffer.begin()),
                      std::make_move_iterator(buffer.end()));
        buffer.clear();
    }

    std::sort(merged.begin(), merged.end());

    Logger::debug("IssueCollector finalized with " + std::to_string(merged.size()) + " records from " +
                  std::to_string(local_buffers_.size()) + " buffers");
    return merged;
}

std::map<IssueCategory, size_t> IssueCollector::counts() const
{
    std::map<IssueCategory, size_t> result;
    for (IssueCategory category : IssueCategories::all())
    {
        size_t n = category_counts_[IssueCategories::index(category)].load();
        if (n > 0)
        {
            result[category] = n;
        }
    }
    return result;
}

size_t IssueCollector::count(IssueCategory category) const
{
    return category_counts_[IssueCategories::index(category)].load();
}

size_t IssueCollector::count(IssueSeverity severity) const
{
    return severity_counts_[static_cast<size_t>(severity)].load();
}

void IssueCollector::tally(const IssueRecord &record)
{
    category_counts_[IssueCategories::index(record.category)].fetch_add(1);
    severity_counts_[static_cast<size_t>(record.severity)].fetch_add(1);
    total_.fetch_add(1);
}
