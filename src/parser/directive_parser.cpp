#include "parser/directive_parser.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <unordered_map>

namespace logictest {

// ============================================================================
// Line helpers
// ============================================================================

std::string strip_comment(std::string_view line) {
    const size_t pos = utils::find_unescaped_hash(line);
    return std::string(pos == std::string_view::npos ? line : line.substr(0, pos));
}

bool is_comment_line(std::string_view line) {
    const size_t first = line.find_first_not_of(" \t");
    return first != std::string_view::npos && line[first] == '#';
}

// ============================================================================
// DirectiveParser
// ============================================================================

DirectiveParser::DirectiveParser(LineSource& source)
    : source_(source) {}

std::optional<DirectiveParser::Directive> DirectiveParser::lookup_directive(std::string_view token) {
    static const std::unordered_map<std::string_view, Directive> lookup = {
        {"halt",           Directive::HALT},
        {"skipif",         Directive::SKIP_IF},
        {"onlyif",         Directive::ONLY_IF},
        {"hash-threshold", Directive::HASH_THRESHOLD},
        {"statement",      Directive::STATEMENT},
        {"query",          Directive::QUERY},
    };

    const auto it = lookup.find(token);
    if (it != lookup.end()) {
        return it->second;
    }
    return std::nullopt;
}

Record DirectiveParser::emit(Record::Data& data) {
    data.conditions = std::move(pending_conditions_);
    pending_conditions_.clear();
    data.hash_threshold = hash_threshold_;
    return Record(std::move(data));
}

Result<ParseOutcome> DirectiveParser::next() {
    using R = Result<ParseOutcome>;

    State state = State::START;
    Record::Data data;
    std::string body;
    bool has_body = false;

    auto record_outcome = [this](Record::Data& d) {
        return R::ok(ParseOutcome{ParseStep::RECORD, emit(d)});
    };
    auto parse_error = [](int line_num, const std::string& msg) {
        return R::error(ErrorCategory::PARSE_ERROR, std::format("line {}: {}", line_num, msg));
    };

    std::string line;
    while (source_.next_line(line)) {
        const int line_num = source_.line_number();

        // Lines that are entirely comment never contribute to a record
        if (is_comment_line(line)) {
            continue;
        }

        const bool blank = utils::is_blank(line);
        const std::string stripped = strip_comment(line);

        switch (state) {
            case State::START: {
                if (blank) {
                    continue;
                }
                const auto fields = utils::split_whitespace(stripped);
                if (fields.empty()) {
                    continue;
                }

                const auto directive = lookup_directive(fields[0]);
                if (!directive) {
                    return parse_error(line_num, std::format("unknown directive '{}'", fields[0]));
                }

                switch (*directive) {
                    case Directive::HALT:
                        data.type = RecordType::HALT;
                        data.line_num = line_num;
                        data.directive_line = line_num;
                        data.last_line = line_num;
                        return record_outcome(data);

                    case Directive::SKIP_IF:
                    case Directive::ONLY_IF:
                        if (fields.size() < 2) {
                            return parse_error(line_num,
                                std::format("'{}' requires an engine name", fields[0]));
                        }
                        pending_conditions_.push_back(*directive == Directive::ONLY_IF
                            ? Condition::only(fields[1])
                            : Condition::skip(fields[1]));
                        break;

                    case Directive::HASH_THRESHOLD: {
                        const auto value = fields.size() > 1
                            ? utils::try_parse_int<int>(fields[1]) : std::nullopt;
                        if (!value || *value < 0) {
                            return parse_error(line_num,
                                "hash-threshold requires a non-negative integer");
                        }
                        hash_threshold_ = *value;
                        return R::ok(ParseOutcome{ParseStep::DIRECTIVE, std::nullopt});
                    }

                    case Directive::STATEMENT:
                        if (fields.size() < 2 || (fields[1] != "ok" && fields[1] != "error")) {
                            return parse_error(line_num, std::format("unexpected token '{}'",
                                fields.size() < 2 ? std::string() : fields[1]));
                        }
                        data.type = RecordType::STATEMENT;
                        data.expect_error = fields[1] == "error";
                        data.directive_line = line_num;
                        data.last_line = line_num;
                        state = State::STATEMENT_BODY;
                        break;

                    case Directive::QUERY:
                        if (fields.size() < 2) {
                            return parse_error(line_num, "query requires a result schema");
                        }
                        data.type = RecordType::QUERY;
                        data.schema = fields[1];
                        if (fields.size() > 2) {
                            const auto mode = parse_sort_mode(fields[2]);
                            if (!mode) {
                                return parse_error(line_num,
                                    std::format("unknown sort mode '{}'", fields[2]));
                            }
                            data.sort_mode = *mode;
                        }
                        if (fields.size() > 3) {
                            data.label = fields[3];
                        }
                        data.directive_line = line_num;
                        data.last_line = line_num;
                        state = State::QUERY_BODY;
                        break;
                }
                break;
            }

            case State::STATEMENT_BODY:
                if (blank) {
                    if (!has_body) {
                        return parse_error(line_num, "statement has no SQL text");
                    }
                    data.query = std::move(body);
                    return record_outcome(data);
                }
                if (!has_body) {
                    data.line_num = line_num;
                    has_body = true;
                }
                body += stripped;
                data.last_line = line_num;
                break;

            case State::QUERY_BODY:
                if (!blank && utils::trim(stripped) == kSeparator) {
                    if (!has_body) {
                        return parse_error(line_num, "query has no SQL text before separator");
                    }
                    data.query = std::move(body);
                    data.separator_line = line_num;
                    data.last_line = line_num;
                    state = State::RESULTS_BODY;
                    break;
                }
                if (blank) {
                    if (!has_body) {
                        return parse_error(line_num, "query has no SQL text");
                    }
                    data.query = std::move(body);
                    return record_outcome(data);
                }
                if (!has_body) {
                    data.line_num = line_num;
                    has_body = true;
                }
                body += stripped;
                data.last_line = line_num;
                break;

            case State::RESULTS_BODY:
                if (blank) {
                    return record_outcome(data);
                }
                data.result.push_back(stripped);
                data.last_line = line_num;
                break;
        }
    }

    if (source_.has_error()) {
        return R::error(ErrorCategory::IO_ERROR,
            std::format("read failed after line {}", source_.line_number()));
    }

    // End of input: finalize whatever has accumulated
    switch (state) {
        case State::START:
            return R::ok(ParseOutcome{ParseStep::END_OF_INPUT, std::nullopt});
        case State::STATEMENT_BODY:
        case State::QUERY_BODY:
            if (!has_body) {
                return parse_error(source_.line_number(),
                    std::format("{} has no SQL text", record_type_to_string(data.type)));
            }
            data.query = std::move(body);
            return record_outcome(data);
        case State::RESULTS_BODY:
            return record_outcome(data);
    }
    return R::error(ErrorCategory::INTERNAL_ERROR, "unreachable parser state");
}

// ============================================================================
// Whole-file parsing
// ============================================================================

Result<std::vector<Record>> parse_records(std::istream& input) {
    LineSource source(input);
    DirectiveParser parser(source);
    std::vector<Record> records;

    while (true) {
        auto outcome = parser.next();
        if (outcome.is_error()) {
            return Result<std::vector<Record>>::error(
                outcome.error_category(), outcome.error_message());
        }

        auto& step = outcome.value();
        if (step.step == ParseStep::END_OF_INPUT) {
            break;
        }
        if (step.step == ParseStep::RECORD) {
            records.push_back(std::move(*step.record));
        }
    }

    return Result<std::vector<Record>>::ok(std::move(records));
}

Result<std::vector<Record>> parse_test_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<std::vector<Record>>::error(
            ErrorCategory::IO_ERROR, std::format("{}: cannot open file", path));
    }

    auto result = parse_records(file);
    if (result.is_error()) {
        return Result<std::vector<Record>>::error(
            result.error_category(), std::format("{}: {}", path, result.error_message()));
    }
    return result;
}

} // namespace logictest
