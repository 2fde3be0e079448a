#ifndef REPO_TABLE_HPP
#define REPO_TABLE_HPP

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "repo.hpp"

/**
 * @brief Ordered, mutex protected table of repository records.
 *
 * Records are stored in discovery order and keyed by path. Every mutation
 * replaces a whole record under the table lock so readers never observe a
 * partially written entry. Records are created once at construction; unknown
 * paths are reported, never inserted.
 */
class RepoTable {
  public:
    /**
     * @brief Create one record per distinct path.
     *
     * Duplicate paths after the first occurrence are ignored.
     */
    explicit RepoTable(const std::vector<RepoPath>& paths);

    /** @return Number of records. */
    size_t size() const;

    /** @return Whether @a path has a record. */
    bool contains(const RepoPath& path) const;

    /** @return Paths in discovery order. */
    std::vector<RepoPath> paths() const;

    /** @return Copy of the record for @a path, if any. */
    std::optional<RepositoryState> get(const RepoPath& path) const;

    /** @return Consistent copy of all records in discovery order. */
    std::vector<RepositoryState> snapshot() const;

    /**
     * @brief Apply @a fn to a copy of the record and store the copy.
     *
     * @return `false` when @a path is unknown.
     */
    bool update(const RepoPath& path, const std::function<void(RepositoryState&)>& fn);

    /**
     * @brief Mark @a path busy with @a kind unless it already is.
     *
     * The check and the set happen under one lock acquisition.
     *
     * @return `true` if the record was idle and is now busy.
     */
    bool try_begin(const RepoPath& path, OperationKind kind);

    /** @return Number of records with an operation in flight. */
    size_t busy_count() const;

  private:
    mutable std::mutex mtx_;
    std::vector<RepoPath> order_;
    std::map<RepoPath, RepositoryState> records_;
};

#endif // REPO_TABLE_HPP
