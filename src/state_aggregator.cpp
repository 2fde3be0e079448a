#include "state_aggregator.hpp"

#include "logger.hpp"

BeginResult StateAggregator::begin(const RepoPath& path, OperationKind kind) {
    if (table_.try_begin(path, kind))
        return BeginResult::Started;
    return table_.contains(path) ? BeginResult::AlreadyInProgress : BeginResult::Unknown;
}

void StateAggregator::apply(const OperationResult& result) {
    const auto now = std::chrono::system_clock::now();
    bool known = table_.update(result.path, [&](RepositoryState& st) {
        st.pending_operation.reset();
        st.last_operation = result.kind;
        if (result.ok) {
            st.status = RS_CLEAN;
            st.info = result.status;
            st.last_sync = now;
            st.error.reset();
            st.message = result.message;
        } else {
            st.status = RS_ERROR;
            st.error = RepoError{result.failure, result.message};
            st.message.clear();
        }
    });
    if (!known) {
        log_warning("Dropping result for unknown repository",
                    LogFields{{"repo", result.path.string()}});
        return;
    }
    ++applied_;
    if (result.ok) {
        log_debug("Operation finished", LogFields{{"repo", result.path.string()},
                                                  {"op", operation_label(result.kind)}});
        return;
    }
    log_warning("Operation failed", LogFields{{"repo", result.path.string()},
                                             {"op", operation_label(result.kind)},
                                             {"kind", failure_label(result.failure)},
                                             {"error", result.message}});
    errors_.push_back(ErrorLogEntry{now, result.path, result.kind, result.failure, result.message});
    while (errors_.size() > MAX_ERROR_LOG)
        errors_.pop_front();
}
