#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace gas_deblend::core {

using json = nlohmann::json;

// JSON-lines event stream for one run. Every event carries type, run_id and ts.
class EventEmitter {
public:
    EventEmitter() = default;
    explicit EventEmitter(std::string run_id) : run_id_(std::move(run_id)) {}

    const std::string& run_id() const { return run_id_; }

    void run_start(const json& extra, std::ostream& out);
    void run_end(bool success, const std::string& status, std::ostream& out);

    void stage_start(Stage stage, std::ostream& out);
    void stage_progress(Stage stage, int current, int total,
                        const std::string& message, std::ostream& out);
    void stage_end(Stage stage, const std::string& status,
                   const json& extra, std::ostream& out);

    void warning(const std::string& message, std::ostream& out);
    void error(const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type) const;

    std::string run_id_;
};

} // namespace gas_deblend::core
