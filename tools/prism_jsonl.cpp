//! # prism_jsonl
//!
//! Reads JSON Lines event records from a file or stdin, checks them against
//! the `Event` shape and writes them back out, compact or pretty.
//!
//! ## Usage
//!
//! ```bash
//! prism_jsonl events.jsonl
//! cat events.jsonl | prism_jsonl --pretty
//! prism_jsonl --strict --log-level=debug events.jsonl
//! ```
//!
//! ## Record Format
//!
//! ```json
//! {"id": 7, "source": "gateway", "event": {"type": "request", "method": "GET",
//!  "path": "/health", "status": 200}, "tags": ["edge"]}
//! ```
//!
//! Exit code 1 on the first record that fails, with the error printed to
//! stderr.

#include "prism/json/json.hpp"
#include "prism/log/log.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace {

struct Login {
    std::string user;
    bool success = false;
};

struct Request {
    std::string method;
    std::string path;
    uint16_t status = 0;
    std::optional<double> latency_ms;
};

using EventKind = std::variant<Login, Request, std::monostate>;

struct Event {
    uint64_t id = 0;
    std::string source;
    EventKind event;
    std::vector<std::string> tags;
    std::map<std::string, std::string> labels;
};

} // namespace

template <> struct prism::ShapeTraits<Login> {
    static auto make() -> Shape {
        return StructBuilder<Login>("Login")
            .field("user", &Login::user)
            .field("success", &Login::success)
            .build();
    }
};

template <> struct prism::ShapeTraits<Request> {
    static auto make() -> Shape {
        return StructBuilder<Request>("Request")
            .field("method", &Request::method)
            .field("path", &Request::path)
            .field("status", &Request::status)
            .field("latency_ms", &Request::latency_ms, {.flags = FIELD_SKIP_IF_DEFAULT})
            .build();
    }
};

template <> struct prism::ShapeTraits<EventKind> {
    static auto make() -> Shape {
        return EnumBuilder<EventKind>("EventKind")
            .variant<0>("login")
            .variant<1>("request")
            .unit<2>("heartbeat")
            .internal("type")
            .build();
    }
};

template <> struct prism::ShapeTraits<Event> {
    static auto make() -> Shape {
        return StructBuilder<Event>("Event")
            .field("id", &Event::id)
            .field("source", &Event::source)
            .field("event", &Event::event)
            .field("tags", &Event::tags, {.flags = FIELD_SKIP_IF_DEFAULT | FIELD_DEFAULT})
            .field("labels", &Event::labels, {.flags = FIELD_SKIP_IF_DEFAULT | FIELD_DEFAULT})
            .build();
    }
};

namespace {

void print_usage() {
    std::cerr << R"(prism_jsonl - reformat and validate JSON Lines event records

Usage: prism_jsonl [options] [file]

Options:
  --pretty          Indent each record over several lines
  --strict          Reject unknown fields
  --log-level=LVL   trace, debug, info, warn, error, off
  --log-filter=SPEC Per-module levels, e.g. "deser=trace,*=warn"
  --log-file=PATH   Also write logs to PATH
  --log-format=FMT  text or json
  -v, -vv, -q       More or less logging
  --help, -h        Show this help message

Reads stdin when no file is given.
)";
}

auto is_log_flag(std::string_view arg) -> bool {
    return arg.starts_with("--log-") || arg == "-q" || arg == "--quiet" || arg == "--verbose" ||
           arg == "-v" || arg == "-vv" || arg == "-vvv";
}

} // namespace

int main(int argc, char* argv[]) {
    prism::log::Logger::init(prism::log::parse_log_options(argc, argv));

    bool pretty = false;
    prism::json::DeserializeOptions options;
    std::string path;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--pretty") {
            pretty = true;
        } else if (arg == "--strict") {
            options.deny_unknown_fields = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (is_log_flag(arg)) {
            continue;
        } else if (arg.starts_with("-")) {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return 1;
        } else {
            path = arg;
        }
    }

    std::string input;
    if (path.empty()) {
        input.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            std::cerr << "error: cannot open " << path << "\n";
            return 1;
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        input = buffer.str();
    }
    PRISM_LOG_INFO("app", "read " << input.size() << " bytes from "
                                  << (path.empty() ? std::string("stdin") : path));

    prism::json::SerializeOptions output;
    output.indent = pretty ? 2 : 0;

    prism::json::Cursor cursor;
    size_t records = 0;
    while (true) {
        auto next = prism::json::from_str_next<Event>(input, cursor, options);
        if (prism::is_err(next)) {
            std::cerr << prism::unwrap_err(next).to_string() << "\n";
            return 1;
        }
        auto& event = prism::unwrap(next);
        if (!event) {
            break;
        }

        std::string out;
        auto written = prism::json::serialize(prism::shape_of<Event>(), &*event, out, output);
        if (prism::is_err(written)) {
            std::cerr << prism::unwrap_err(written).to_string() << "\n";
            return 1;
        }
        std::cout << out << "\n";
        ++records;
    }

    PRISM_LOG_INFO("app", "wrote " << records << " records");
    prism::log::Logger::instance().flush();
    return 0;
}
