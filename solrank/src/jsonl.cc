#include <memory>
#include <solrank/jsonl.hh>
#include <solranklib/file_contents.hh>
#include <solranklib/macros/throw.hh>
#include <solranklib/string_transform.hh>

namespace solrank {

namespace {

const Json::CharReaderBuilder& reader_builder() {
    static const Json::CharReaderBuilder builder = [] {
        Json::CharReaderBuilder b;
        b["allowSpecialFloats"] = true;
        b["collectComments"] = false;
        b["failIfExtra"] = true;
        return b;
    }();
    return builder;
}

const Json::StreamWriterBuilder& writer_builder() {
    static const Json::StreamWriterBuilder builder = [] {
        Json::StreamWriterBuilder b;
        b["indentation"] = "";
        b["useSpecialFloats"] = true;
        b["emitUTF8"] = true;
        b["precision"] = 17;
        b["precisionType"] = "significant";
        return b;
    }();
    return builder;
}

} // namespace

Json::Value parse_json(std::string_view text) {
    std::unique_ptr<Json::CharReader> reader{reader_builder().newCharReader()};
    Json::Value value;
    std::string errs;
    if (not reader->parse(text.data(), text.data() + text.size(), &value, &errs)) {
        THROW("invalid JSON: ", errs);
    }
    return value;
}

std::optional<std::string_view>
source_integer_literal(const Json::Value& value, std::string_view source_text) noexcept {
    if (value.type() != Json::realValue) {
        return std::nullopt;
    }
    auto beg = value.getOffsetStart();
    auto end = value.getOffsetLimit();
    if (beg < 0 or end <= beg or static_cast<size_t>(end) > source_text.size()) {
        return std::nullopt;
    }
    auto token = source_text.substr(beg, end - beg);
    auto digits = token;
    if (digits.front() == '-') {
        digits.remove_prefix(1);
    }
    if (digits.empty() or digits.find_first_not_of("0123456789") != std::string_view::npos) {
        return std::nullopt;
    }
    // Offsets of a value moved from another document point to garbage
    if (str2num<double>(token) != value.asDouble()) {
        return std::nullopt;
    }
    return token;
}

namespace {

void append_json(
    std::string& out, const Json::Value& value, const std::vector<std::string_view>& source_texts
) {
    switch (value.type()) {
    case Json::arrayValue: {
        out += '[';
        for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            append_json(out, value[i], source_texts);
        }
        out += ']';
        return;
    }
    case Json::objectValue: {
        out += '{';
        bool first = true;
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (not first) {
                out += ',';
            }
            first = false;
            out += Json::writeString(writer_builder(), Json::Value{it.name()});
            out += ':';
            append_json(out, *it, source_texts);
        }
        out += '}';
        return;
    }
    case Json::realValue:
        for (auto source_text : source_texts) {
            if (auto literal = source_integer_literal(value, source_text)) {
                out += *literal;
                return;
            }
        }
        break;
    case Json::nullValue:
    case Json::intValue:
    case Json::uintValue:
    case Json::stringValue:
    case Json::booleanValue: break;
    }
    out += Json::writeString(writer_builder(), value);
}

} // namespace

std::string
to_json_line(const Json::Value& value, const std::vector<std::string_view>& source_texts) {
    if (source_texts.empty()) {
        return Json::writeString(writer_builder(), value);
    }
    std::string res;
    append_json(res, value, source_texts);
    return res;
}

std::vector<JsonLine> read_jsonl_file(const std::string& path) {
    std::string contents = get_file_contents(path);
    std::vector<JsonLine> lines;
    size_t line_no = 0;
    size_t beg = 0;
    while (beg < contents.size()) {
        size_t end = contents.find('\n', beg);
        if (end == std::string::npos) {
            end = contents.size();
        }
        ++line_no;
        std::string_view line{contents.data() + beg, end - beg};
        beg = end + 1;
        if (line.find_first_not_of(" \t\r") == std::string_view::npos) {
            continue;
        }

        try {
            auto value = parse_json(line);
            lines.push_back({std::move(value), std::string{line}, line_no});
        } catch (const std::runtime_error& e) {
            THROW(path, ':', line_no, ": ", e.what());
        }
    }
    return lines;
}

void write_jsonl_file(
    const std::string& path,
    const std::vector<Json::Value>& values,
    const std::vector<std::string_view>& source_texts
) {
    std::string contents;
    for (const auto& value : values) {
        contents += to_json_line(value, source_texts);
        contents += '\n';
    }
    put_file_contents(path, contents);
}

} // namespace solrank
