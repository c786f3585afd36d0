/// basic_usage.cpp: svcdi introductory example.
///
/// Walks through registration, validation, resolution and scoping:
///   1. Describe services with a lifetime and their declared dependencies.
///   2. build() validates the whole graph and reports every defect at once.
///   3. Resolve by contract; each request gets its own scope.

#include <svcdi.hpp>

#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace svcdi;

// -----------------------------------------------------------------------
// Domain contracts
// -----------------------------------------------------------------------

struct i_logger {
    virtual ~i_logger() = default;
    virtual void log(const std::string& message) = 0;
};

struct i_greeter {
    virtual ~i_greeter() = default;
    virtual std::string greet(const std::string& name) = 0;
};

struct i_request_context {
    virtual ~i_request_context() = default;
    virtual std::string request_id() const = 0;
};

struct i_audit_sink {
    virtual ~i_audit_sink() = default;
    virtual void record(const std::string& entry) = 0;
};

// -----------------------------------------------------------------------
// Implementations
// -----------------------------------------------------------------------

struct spdlog_logger : i_logger {
    void log(const std::string& message) override {
        spdlog::info("{}", message);
    }
};

struct greeter : i_greeter {
    explicit greeter(std::shared_ptr<i_logger> logger)
        : logger_(std::move(logger)) {}

    std::string greet(const std::string& name) override {
        const auto msg = "Hello, " + name + '!';
        logger_->log(msg);
        return msg;
    }

private:
    std::shared_ptr<i_logger> logger_;
};

struct request_context : i_request_context {
    inline static int counter = 0;
    int id_;

    request_context() : id_(++counter) {}

    std::string request_id() const override {
        return "req-" + std::to_string(id_);
    }
};

struct console_audit : i_audit_sink {
    void record(const std::string& entry) override {
        std::cout << "[audit] " << entry << '\n';
    }
};

struct memory_audit : i_audit_sink {
    std::vector<std::string> entries;
    void record(const std::string& entry) override { entries.push_back(entry); }
};

// Per-request handler: sees its own request context, fans out to every
// audit sink, and only touches the greeter when asked to greet.
struct request_handler {
    request_handler(std::shared_ptr<i_request_context> ctx,
                    std::vector<std::shared_ptr<i_audit_sink>> sinks,
                    lazy<std::shared_ptr<i_greeter>> greeter)
        : ctx_(std::move(ctx)), sinks_(std::move(sinks)), greeter_(std::move(greeter)) {}

    void handle(const std::string& who) {
        for (auto& sink : sinks_) sink->record(ctx_->request_id() + " start");
        std::cout << ctx_->request_id() << ": " << greeter_->greet(who) << '\n';
    }

private:
    std::shared_ptr<i_request_context> ctx_;
    std::vector<std::shared_ptr<i_audit_sink>> sinks_;
    lazy<std::shared_ptr<i_greeter>> greeter_;
};

// A singleton that wrongly holds on to a per-request service.
struct request_cache {
    explicit request_cache(std::shared_ptr<i_request_context>) {}
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    spdlog::set_level(spdlog::level::debug);

    // ── A broken configuration is rejected as a whole ────────────────
    {
        registry broken;
        broken.add(scoped<i_request_context, request_context>());
        broken.add(singleton<request_cache>(deps<i_request_context>));
        broken.add(singleton<i_greeter, greeter>(deps<i_logger>)); // i_logger missing

        try {
            broken.build();
        } catch (const validation_error& e) {
            std::cout << "Rejected configuration:\n" << e.what() << "\n\n";
        }
    }

    // ── Registration phase ────────────────────────────────────────────
    registry reg;
    reg.add(singleton<i_logger, spdlog_logger>());
    reg.add(singleton<i_greeter, greeter>(deps<i_logger>));
    reg.add(scoped<i_request_context, request_context>());
    reg.add(singleton<i_audit_sink, console_audit>());
    reg.add(singleton<i_audit_sink, memory_audit>());
    reg.add(scoped<request_handler>(
        deps<i_request_context, zero_or_more<i_audit_sink>, deferred<i_greeter>>));

    // ── Build phase (validates dependency graph) ──────────────────────
    auto root = reg.build();

    // ── Resolution phase ──────────────────────────────────────────────
    const auto g1 = root->get_required<i_greeter>();
    const auto g2 = root->get_required<i_greeter>();
    if (g1.get() != g2.get()) {
        std::cerr << "singleton returned two instances\n";
        return 1;
    }

    for (const std::string who : {"Ada", "Grace"}) {
        auto scope = root->create_scope();
        scope->get_required<request_handler>()->handle(who);
    }
    // Scopes released here; all scoped instances destroyed.

    auto memory = std::static_pointer_cast<memory_audit>(root->get_all<i_audit_sink>().back());
    std::cout << "memory audit holds " << memory->entries.size() << " entries\n";

    std::cout << "Done.\n";
    return 0;
}
