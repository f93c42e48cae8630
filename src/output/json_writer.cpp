#include "output/json_writer.h"

#include <cstdio>
#include <sstream>
#include <variant>

namespace {

// Minimal streaming writer; tracks whether a separator is due
class JsonWriter {
public:
    explicit JsonWriter(bool pretty) : pretty_(pretty), depth_(0), first_(true) {}

    void begin_object() { open('{'); }
    void end_object() { close('}'); }
    void begin_array() { open('['); }
    void end_array() { close(']'); }

    void key(const char* name) {
        separate();
        out_ << json_quote(name) << (pretty_ ? ": " : ":");
        first_ = false;
        pending_value_ = true;  // the value that follows takes no separator
    }

    void value(int v) { prefix(); out_ << v; }
    void value(const std::string& v) { prefix(); out_ << json_quote(v); }
    void null() { prefix(); out_ << "null"; }

    void int_array(const std::vector<int>& values) {
        begin_array();
        for (int v : values) value(v);
        end_array();
    }

    std::string str() const { return out_.str(); }

private:
    std::ostringstream out_;
    bool pretty_;
    int depth_;
    bool first_;
    bool pending_value_ = false;

    void prefix() {
        if (pending_value_) {
            pending_value_ = false;
            return;
        }
        separate();
        first_ = false;
    }

    void separate() {
        if (!first_) out_ << ",";
        if (pretty_ && depth_ > 0) out_ << "\n" << std::string(depth_ * 2, ' ');
    }

    void open(char c) {
        prefix();
        out_ << c;
        depth_++;
        first_ = true;
    }

    void close(char c) {
        depth_--;
        if (pretty_ && !first_) out_ << "\n" << std::string(depth_ * 2, ' ');
        out_ << c;
        first_ = false;
    }
};

void write_step(JsonWriter& w, const StepRecord& step, Technique technique) {
    w.begin_object();
    w.key("key"); w.value(step.key);
    if (step.error) {
        w.key("error"); w.value(*step.error);
        w.end_object();
        return;
    }
    w.key("initial_hash"); w.value(step.initial_hash);
    if (technique == Technique::CHAINING) {
        w.key("final_index"); w.value(step.final_index);
        w.key("chain_length"); w.value(step.chain_length.value_or(0));
    } else {
        if (step.h2_value) {
            w.key("h2_value"); w.value(*step.h2_value);
        }
        w.key("probe_sequence"); w.int_array(step.probe_sequence);
        w.key("final_index"); w.value(step.final_index);
        w.key("collisions"); w.value(step.collisions);
    }
    w.key("formula"); w.value(step.formula);
    w.end_object();
}

void write_solution(JsonWriter& w, const TableSolution& solution) {
    w.begin_array();
    if (const auto* slots = std::get_if<ProbeTable>(&solution)) {
        for (const auto& slot : *slots) {
            if (slot) w.value(*slot);
            else w.null();
        }
    } else if (const auto* chains = std::get_if<ChainTable>(&solution)) {
        for (const auto& chain : *chains) {
            w.int_array(chain);
        }
    }
    w.end_array();
}

} // namespace

std::string json_quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += '"';
    return out;
}

std::string step_to_json(const StepRecord& step, Technique technique) {
    JsonWriter w(false);
    write_step(w, step, technique);
    return w.str();
}

std::string to_json(const PuzzleResult& puzzle, bool pretty) {
    JsonWriter w(pretty);
    w.begin_object();
    w.key("technique"); w.value(puzzle.technique_id);
    w.key("technique_label"); w.value(puzzle.technique_label);
    w.key("table_size"); w.value(puzzle.table_size);
    w.key("keys"); w.int_array(puzzle.keys);
    w.key("solution"); write_solution(w, puzzle.solution);
    w.key("steps");
    w.begin_array();
    for (const auto& step : puzzle.steps) {
        write_step(w, step, puzzle.technique);
    }
    w.end_array();
    w.key("description"); w.value(puzzle.description);
    w.key("formula_label"); w.value(puzzle.formula_label);
    w.end_object();
    return w.str();
}
