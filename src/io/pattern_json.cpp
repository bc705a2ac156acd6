#include "voxstore/io/pattern_json.hpp"
#include "voxstore/errors.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <variant>
#include <vector>

namespace voxstore::io {

namespace {

// Minimal JSON document model, enough for pattern files.
struct JsonValue;
using JsonArray = std::vector<JsonValue>;
using JsonObject = std::map<std::string, JsonValue>;

struct JsonValue {
    std::variant<std::nullptr_t, bool, double, std::string,
                 std::shared_ptr<JsonArray>, std::shared_ptr<JsonObject>> v;

    const JsonArray& array(const char* key) const {
        auto p = std::get_if<std::shared_ptr<JsonArray>>(&v);
        if (!p) throw DataError(std::string("expected array for '") + key + "'");
        return **p;
    }
    const JsonObject& object(const char* key) const {
        auto p = std::get_if<std::shared_ptr<JsonObject>>(&v);
        if (!p) throw DataError(std::string("expected object for '") + key + "'");
        return **p;
    }
    double number(const char* key) const {
        auto p = std::get_if<double>(&v);
        if (!p) throw DataError(std::string("expected number for '") + key + "'");
        return *p;
    }
    const std::string& string(const char* key) const {
        auto p = std::get_if<std::string>(&v);
        if (!p) throw DataError(std::string("expected string for '") + key + "'");
        return *p;
    }
};

class Parser {
public:
    explicit Parser(std::string_view s) : s_(s) {}

    JsonValue parse_document() {
        JsonValue v = parse_value();
        skip_ws();
        if (pos_ != s_.size()) fail("trailing characters");
        return v;
    }

private:
    [[noreturn]] void fail(const std::string& what) const {
        throw DataError("malformed pattern JSON at offset " + std::to_string(pos_) + ": " + what);
    }

    void skip_ws() {
        while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) ++pos_;
    }

    char peek() {
        skip_ws();
        if (pos_ >= s_.size()) fail("unexpected end of input");
        return s_[pos_];
    }

    void expect(char c) {
        if (peek() != c) fail(std::string("expected '") + c + "'");
        ++pos_;
    }

    bool consume_literal(std::string_view lit) {
        if (s_.substr(pos_, lit.size()) != lit) return false;
        pos_ += lit.size();
        return true;
    }

    JsonValue parse_value() {
        char c = peek();
        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return JsonValue{parse_string()};
        if (consume_literal("true")) return JsonValue{true};
        if (consume_literal("false")) return JsonValue{false};
        if (consume_literal("null")) return JsonValue{nullptr};
        return JsonValue{parse_number()};
    }

    JsonValue parse_object() {
        expect('{');
        auto obj = std::make_shared<JsonObject>();
        if (peek() == '}') { ++pos_; return JsonValue{obj}; }
        for (;;) {
            if (peek() != '"') fail("expected key");
            std::string key = parse_string();
            expect(':');
            (*obj)[key] = parse_value();
            char c = peek();
            ++pos_;
            if (c == '}') break;
            if (c != ',') fail("expected ',' or '}'");
        }
        return JsonValue{obj};
    }

    JsonValue parse_array() {
        expect('[');
        auto arr = std::make_shared<JsonArray>();
        if (peek() == ']') { ++pos_; return JsonValue{arr}; }
        for (;;) {
            arr->push_back(parse_value());
            char c = peek();
            ++pos_;
            if (c == ']') break;
            if (c != ',') fail("expected ',' or ']'");
        }
        return JsonValue{arr};
    }

    std::string parse_string() {
        expect('"');
        std::string out;
        while (pos_ < s_.size() && s_[pos_] != '"') {
            char c = s_[pos_++];
            if (c == '\\') {
                if (pos_ >= s_.size()) fail("bad escape");
                char e = s_[pos_++];
                switch (e) {
                case '"': case '\\': case '/': out.push_back(e); break;
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                default: fail("unsupported escape");
                }
            } else {
                out.push_back(c);
            }
        }
        if (pos_ >= s_.size()) fail("unterminated string");
        ++pos_;
        return out;
    }

    double parse_number() {
        skip_ws();
        std::string tok;
        while (pos_ < s_.size() && (std::isdigit(static_cast<unsigned char>(s_[pos_])) ||
                                    s_[pos_] == '-' || s_[pos_] == '+' || s_[pos_] == '.' ||
                                    s_[pos_] == 'e' || s_[pos_] == 'E'))
            tok.push_back(s_[pos_++]);
        if (tok.empty()) fail("unexpected character");
        char* end = nullptr;
        double d = std::strtod(tok.c_str(), &end);
        if (end != tok.c_str() + tok.size()) fail("bad number '" + tok + "'");
        return d;
    }

    std::string_view s_;
    size_t pos_{0};
};

const JsonValue& field(const JsonObject& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) throw DataError(std::string("missing key '") + key + "'");
    return it->second;
}

int as_int(const JsonValue& v, const char* key) {
    double d = v.number(key);
    if (d != std::floor(d) || std::fabs(d) > 2147483647.0)
        throw DataError(std::string("expected integer for '") + key + "'");
    return static_cast<int>(d);
}

size_t as_size(const JsonValue& v, const char* key) {
    double d = v.number(key);
    if (d < 0 || d != std::floor(d) || d > 9007199254740992.0)
        throw DataError(std::string("expected non-negative integer for '") + key + "'");
    return static_cast<size_t>(d);
}

template <typename T, size_t N, typename Conv>
std::array<T, N> fixed_array(const JsonObject& obj, const char* key, Conv conv) {
    const auto& arr = field(obj, key).array(key);
    if (arr.size() != N)
        throw DataError(std::string("expected ") + std::to_string(N) + " entries for '" + key + "'");
    std::array<T, N> out{};
    for (size_t i = 0; i < N; ++i) out[i] = conv(arr[i], key);
    return out;
}

std::string fmt_double(double d) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", d);
    return buf;
}

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace

std::string pattern_to_json(const PatternRecord& rec) {
    std::ostringstream os;
    os << "{\n  \"voxels\": [";
    for (size_t i = 0; i < rec.voxels.size(); ++i) {
        const auto& v = rec.voxels[i];
        os << (i ? ",\n    " : "\n    ")
           << "{\"x\": " << v.x << ", \"y\": " << v.y << ", \"z\": " << v.z
           << ", \"intensity\": " << fmt_double(v.intensity)
           << ", \"polarization\": " << fmt_double(v.polarization) << '}';
    }
    os << (rec.voxels.empty() ? "],\n" : "\n  ],\n");
    os << "  \"grid_size\": [" << rec.grid_size[0] << ", " << rec.grid_size[1] << ", " << rec.grid_size[2] << "],\n";
    os << "  \"voxel_pitch\": [" << fmt_double(rec.voxel_pitch[0]) << ", " << fmt_double(rec.voxel_pitch[1])
       << ", " << fmt_double(rec.voxel_pitch[2]) << "],\n";
    os << "  \"intensity_levels\": " << rec.intensity_levels << ",\n";
    os << "  \"intensity_range\": [" << fmt_double(rec.intensity_range[0]) << ", "
       << fmt_double(rec.intensity_range[1]) << "],\n";
    os << "  \"polarization_states\": " << rec.polarization_states << ",\n";
    os << "  \"polarization_range\": [" << fmt_double(rec.polarization_range[0]) << ", "
       << fmt_double(rec.polarization_range[1]) << "],\n";
    os << "  \"bits_per_voxel\": " << rec.bits_per_voxel << ",\n";
    os << "  \"encoded_bit_length\": " << rec.encoded_bit_length << ",\n";
    os << "  \"data_bit_length\": " << rec.data_bit_length << ",\n";
    os << "  \"padding_bits\": " << rec.padding_bits << ",\n";
    os << "  \"error_correction\": " << quote(rec.error_correction) << ",\n";
    os << "  \"error_correction_metadata\": {";
    bool first = true;
    for (const auto& [k, v] : rec.error_correction_metadata) {
        os << (first ? "" : ", ") << quote(k) << ": " << v;
        first = false;
    }
    os << "},\n";
    os << "  \"data_length_bytes\": " << rec.data_length_bytes << "\n}\n";
    return os.str();
}

PatternRecord pattern_from_json(std::string_view text) {
    JsonValue doc = Parser(text).parse_document();
    const auto& obj = doc.object("<root>");

    PatternRecord rec;
    for (const auto& jv : field(obj, "voxels").array("voxels")) {
        const auto& vo = jv.object("voxels[]");
        VoxelRecord v;
        v.x = as_int(field(vo, "x"), "x");
        v.y = as_int(field(vo, "y"), "y");
        v.z = as_int(field(vo, "z"), "z");
        v.intensity = field(vo, "intensity").number("intensity");
        v.polarization = field(vo, "polarization").number("polarization");
        rec.voxels.push_back(v);
    }
    auto num = [](const JsonValue& v, const char* key) { return v.number(key); };
    rec.grid_size = fixed_array<int, 3>(obj, "grid_size", as_int);
    rec.voxel_pitch = fixed_array<double, 3>(obj, "voxel_pitch", num);
    rec.intensity_levels = as_int(field(obj, "intensity_levels"), "intensity_levels");
    rec.intensity_range = fixed_array<double, 2>(obj, "intensity_range", num);
    rec.polarization_states = as_int(field(obj, "polarization_states"), "polarization_states");
    rec.polarization_range = fixed_array<double, 2>(obj, "polarization_range", num);
    rec.bits_per_voxel = as_int(field(obj, "bits_per_voxel"), "bits_per_voxel");
    rec.encoded_bit_length = as_size(field(obj, "encoded_bit_length"), "encoded_bit_length");
    rec.data_bit_length = as_size(field(obj, "data_bit_length"), "data_bit_length");
    rec.padding_bits = as_size(field(obj, "padding_bits"), "padding_bits");
    rec.error_correction = field(obj, "error_correction").string("error_correction");
    if (auto it = obj.find("error_correction_metadata"); it != obj.end()) {
        for (const auto& [k, v] : it->second.object("error_correction_metadata"))
            rec.error_correction_metadata[k] = as_int(v, k.c_str());
    }
    rec.data_length_bytes = as_size(field(obj, "data_length_bytes"), "data_length_bytes");
    return rec;
}

void save_pattern(const StoragePattern& pattern, const std::filesystem::path& path) {
    std::ofstream f(path);
    if (!f) throw std::runtime_error("cannot open " + path.string() + " for writing");
    f << pattern_to_json(pattern.to_record());
    if (!f) throw std::runtime_error("write to " + path.string() + " failed");
}

StoragePattern load_pattern(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("cannot open " + path.string());
    std::string txt((std::istreambuf_iterator<char>(f)), {});
    return StoragePattern::from_record(pattern_from_json(txt));
}

} // namespace voxstore::io
