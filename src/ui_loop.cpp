#include "ui_loop.hpp"

#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "command_dispatcher.hpp"
#include "event_loop.hpp"
#include "event_queue.hpp"
#include "logger.hpp"
#include "repo_table.hpp"
#include "scanner.hpp"
#include "state_aggregator.hpp"
#include "terminal_input.hpp"
#include "version.hpp"
#include "worker_pool.hpp"

namespace {

constexpr std::chrono::milliseconds LIST_POLL{100};

std::unique_ptr<WorkerPool> make_pool(size_t capacity, const GitExecutor& exec,
                                      EventQueue& events) {
    return std::make_unique<WorkerPool>(
        capacity,
        [&exec](const Task& t, const std::atomic<bool>& cancel) { return exec.execute(t, cancel); },
        [&events](OperationResult res) {
            events.push(LoopEvent::make_completion(std::move(res)));
        });
}

} // namespace

void setup_logging(const LoggingOptions& opts) {
    if (!opts.log_file.empty()) {
        set_json_logging(opts.json_log);
        set_log_compression(opts.compress_logs);
        init_logger(opts.log_file, opts.log_level, opts.max_log_size, opts.max_log_files);
    }
    if (opts.use_syslog)
        init_syslog(opts.syslog_facility);
    set_log_level(opts.log_level);
}

ExecutorConfig executor_config(const Options& opts) {
    ExecutorConfig cfg;
    cfg.git_binary = opts.git_binary;
    cfg.refresh_timeout = opts.refresh_timeout;
    cfg.operation_timeout = opts.op_timeout;
    for (const auto& [path, ro] : opts.repo_settings) {
        if (ro.timeout)
            cfg.repo_timeouts[path] = *ro.timeout;
    }
    return cfg;
}

DisplayOptions display_options(const Options& opts) {
    DisplayOptions d;
    d.no_colors = opts.no_colors;
    d.custom_color = opts.custom_color;
    d.theme = opts.theme;
    d.censor_names = opts.censor_names;
    d.censor_char = opts.censor_char;
    return d;
}

int run_list_mode(const Options& opts, const std::vector<RepoPath>& repos, std::ostream& out) {
    RepoTable table(repos);
    StateAggregator agg(table);
    EventQueue events;
    GitExecutor exec(executor_config(opts));
    auto pool = make_pool(effective_concurrency(opts, repos.size()), exec, events);
    CommandDispatcher disp(
        agg, [&pool](Task t) { pool->submit(std::move(t)); },
        [&pool]() { return pool->cancel_all(); });

    DispatchOutcome started = disp.dispatch(Command{CommandKind::RefreshAll, {}});
    const size_t expected = started.submitted.size();
    while (agg.applied() < expected) {
        if (take_quit_signal()) {
            log_info("List interrupted");
            pool->cancel_all();
        }
        auto ev = events.wait_for(LIST_POLL);
        if (ev && ev->type == LoopEvent::COMPLETION)
            agg.apply(ev->result);
    }
    pool->shutdown();

    bool all_clean = true;
    for (const auto& st : table.snapshot()) {
        out << render_plain_line(st, opts.censor_names, opts.censor_char) << "\n";
        if (st.status != RS_CLEAN)
            all_clean = false;
    }
    out << std::flush;
    return all_clean ? 0 : 2;
}

int run_event_loop(const Options& opts) {
    setup_logging(opts.logging);
    log_info("Program started", LogFields{{"version", GITFLEET_VERSION}});
    if (!opts.config_file.empty())
        log_info("Config loaded", LogFields{{"file", opts.config_file.string()}});

    std::vector<RepoPath> repos = build_repo_list(discovery_options(opts));
    install_signal_handlers();
    int rc = 0;
    if (opts.list_mode) {
        rc = run_list_mode(opts, repos, std::cout);
    } else {
        RepoTable table(repos);
        StateAggregator agg(table);
        EventQueue events;
        GitExecutor exec(executor_config(opts));
        const size_t capacity = effective_concurrency(opts, repos.size());
        auto pool = make_pool(capacity, exec, events);
        log_info("Session started", LogFields{{"repos", std::to_string(repos.size())},
                                              {"concurrency", std::to_string(capacity)}});
        CommandDispatcher disp(
            agg, [&pool](Task t) { pool->submit(std::move(t)); },
            [&pool]() { return pool->cancel_all(); });

        LoopConfig loop_cfg;
        loop_cfg.tick = opts.tick;
        loop_cfg.auto_refresh = opts.auto_refresh;
        loop_cfg.initial_refresh = opts.initial_refresh;
        const DisplayOptions display = display_options(opts);

        AltScreenGuard alt;
        TermGuard term;
        TerminalInput input(events);
        EventLoop loop(
            agg, disp, events, [&display](const UiSnapshot& snap) { draw_tui(snap, display); },
            loop_cfg, [&pool]() { return pool->queued(); });
        input.start();
        rc = loop.run();
        input.stop();
        pool->shutdown();
    }
    log_info("Program exiting");
    shutdown_logger();
    return rc;
}
