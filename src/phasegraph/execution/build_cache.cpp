#include "phasegraph/execution/build_cache.hpp"

namespace phasegraph
{

bool InMemoryBuildCache::try_restore(const std::string& cache_key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_entries.count(cache_key) == 0)
    {
        return false;
    }
    ++m_restore_count;
    return true;
}

bool InMemoryBuildCache::try_store(const std::string& cache_key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_entries.insert(cache_key).second)
    {
        ++m_rejected_store_count;
        return false;
    }
    ++m_store_count;
    return true;
}

bool InMemoryBuildCache::contains(const std::string& cache_key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.count(cache_key) != 0;
}

size_t InMemoryBuildCache::store_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_store_count;
}

size_t InMemoryBuildCache::rejected_store_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_rejected_store_count;
}

size_t InMemoryBuildCache::restore_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_restore_count;
}

std::optional<std::string> BuildStateStore::last_successful_hash(const std::string& state_key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_hashes.find(state_key);
    if (it == m_hashes.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void BuildStateStore::record_success(const std::string& state_key, const std::string& state_hash)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_hashes[state_key] = state_hash;
}

void BuildStateStore::invalidate(const std::string& state_key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_hashes.erase(state_key);
}

} // namespace phasegraph
