/**
 * @file build_cache.hpp
 * @brief State hashing, incremental build state and the build cache.
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include <mutex>

namespace phasegraph
{

/**
 * @brief Computes a fingerprint of an operation's inputs.
 *
 * @details
 * The key identifies the operation across invocations (project and phase).
 * Returning `std::nullopt` means the inputs cannot be fingerprinted, which
 * disables both incremental skipping and the build cache for that operation.
 */
class IStateHashProvider
{
public:
    virtual ~IStateHashProvider() = default;
    virtual std::optional<std::string> compute_state_hash(const std::string& state_key) = 0;
};

using StateHashProviderPtr = std::shared_ptr<IStateHashProvider>;

/**
 * @brief Stores and restores the outputs of successful operations.
 *
 * @par Thread Safety
 * - Implementations must allow concurrent calls from worker threads.
 */
class IBuildCache
{
public:
    virtual ~IBuildCache() = default;

    /**
     * @brief Restore outputs for `cache_key`.
     * @return True if an entry existed and was restored.
     */
    virtual bool try_restore(const std::string& cache_key) = 0;

    /**
     * @brief Store outputs for `cache_key`.
     * @return False if the key was already written (or the store failed).
     */
    virtual bool try_store(const std::string& cache_key) = 0;
};

using BuildCachePtr = std::shared_ptr<IBuildCache>;

/**
 * @brief Process-local build cache.
 *
 * @details
 * Each key is written at most once; later writes are rejected and counted so
 * that callers (and tests) can verify that no two operations race to store the
 * same entry.
 */
class InMemoryBuildCache : public IBuildCache
{
public:
    bool try_restore(const std::string& cache_key) override;
    bool try_store(const std::string& cache_key) override;

    bool contains(const std::string& cache_key) const;
    size_t store_count() const;
    size_t rejected_store_count() const;
    size_t restore_count() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_set<std::string> m_entries;
    size_t m_store_count{0};
    size_t m_rejected_store_count{0};
    size_t m_restore_count{0};
};

/**
 * @brief Last successful state hash per operation, used for incremental skips.
 *
 * @par Thread Safety
 * - All member functions may be called concurrently.
 */
class BuildStateStore
{
public:
    std::optional<std::string> last_successful_hash(const std::string& state_key) const;
    void record_success(const std::string& state_key, const std::string& state_hash);

    /**
     * @brief Forget a key, e.g. after the operation failed.
     */
    void invalidate(const std::string& state_key);

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::string> m_hashes;
};

using BuildStateStorePtr = std::shared_ptr<BuildStateStore>;

} // namespace phasegraph
