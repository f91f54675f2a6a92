/*
 * ubin
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#include <ubin/ubin.hpp>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace {

static void usage() {
    std::cerr << "ubin_dump - print ubin values as JSON\n"
                 "\n"
                 "Usage:\n"
                 "  ubin_dump <FILE> [--all] [--max-depth N | --unbounded] [--hashed] [--strict-keys] [--compact]\n";
}

struct Args {
    std::string file;
    bool all {false};
    bool hashed {false};
    bool strict_keys {false};
    bool compact {false};
    std::uint32_t max_depth {ubin::kDefaultMaxDepth};
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 2)
        return false;
    a.file = argv[1];

    int i = 2;
    while (i < argc) {
        const std::string opt = argv[i++];
        if (opt == "--all")
            a.all = true;
        else if (opt == "--hashed")
            a.hashed = true;
        else if (opt == "--strict-keys")
            a.strict_keys = true;
        else if (opt == "--compact")
            a.compact = true;
        else if (opt == "--unbounded")
            a.max_depth = ubin::kUnboundedDepth;
        else if (opt == "--max-depth" && i < argc) {
            const char* text = argv[i++];
            char* end {};
            const unsigned long long v = std::strtoull(text, &end, 10);
            if (end == text || *end != '\0' || v >= ubin::kUnboundedDepth) {
                std::cerr << "Invalid --max-depth value\n";
                return false;
            }
            a.max_depth = static_cast<std::uint32_t>(v);
        } else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }
    return true;
}

static bool read_file(const std::string& path, std::vector<std::uint8_t>& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f)
        return false;
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return !f.bad();
}

static std::string hex(const std::span<const std::uint8_t> bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string s;
    s.reserve(bytes.size() * 2);
    for (const auto b : bytes) {
        s.push_back(kDigits[b >> 4]);
        s.push_back(kDigits[b & 0x0F]);
    }
    return s;
}

template <typename Writer>
void write_json(Writer& w, const ubin::ValueRef v);

// JSON object keys are strings; other key kinds are rendered as their compact JSON text.
static std::string key_text(const ubin::ValueRef k) {
    if (const auto s = k.try_string())
        return std::string(*s);
    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer> w(sb);
    write_json(w, k);
    return std::string(sb.GetString(), sb.GetSize());
}

template <typename Writer>
void write_json(Writer& w, const ubin::ValueRef v) {
    switch (v.type()) {
    case ubin::Type::Null:
        w.Null();
        break;
    case ubin::Type::Unit:
        // no JSON counterpart
        w.String("()");
        break;
    case ubin::Type::Bool:
        w.Bool(v.as_bool());
        break;
    case ubin::Type::Int: {
        const ubin::Int n = *v.try_int();
        if (n.is_signed)
            w.Int64(n.i);
        else
            w.Uint64(n.u);
        break;
    }
    case ubin::Type::Float: {
        const double d = v.as_f64();
        if (std::isnan(d))
            w.String("NaN");
        else if (std::isinf(d))
            w.String(d > 0 ? "Infinity" : "-Infinity");
        else
            w.Double(d);
        break;
    }
    case ubin::Type::Bytes: {
        const std::string s = hex(v.as_bytes());
        w.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
        break;
    }
    case ubin::Type::String: {
        const auto s = v.as_string();
        w.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
        break;
    }
    case ubin::Type::Seq:
        w.StartArray();
        for (const ubin::ValueRef item : v.items())
            write_json(w, item);
        w.EndArray(v.size());
        break;
    case ubin::Type::Map:
        w.StartObject();
        for (const auto m : v.members()) {
            const std::string k = key_text(m.key);
            w.Key(k.data(), static_cast<rapidjson::SizeType>(k.size()));
            write_json(w, m.value);
        }
        w.EndObject(v.size());
        break;
    }
}

static std::string to_json(const ubin::ValueRef v, const bool compact) {
    rapidjson::StringBuffer sb;
    if (compact) {
        rapidjson::Writer<rapidjson::StringBuffer> w(sb);
        write_json(w, v);
    } else {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> w(sb);
        w.SetIndent(' ', 2);
        write_json(w, v);
    }
    return std::string(sb.GetString(), sb.GetSize());
}

} // namespace

int main(int argc, char** argv) {
    Args args;
    if (!parse_args(argc, argv, args)) {
        usage();
        return 2;
    }

    std::vector<std::uint8_t> data;
    if (!read_file(args.file, data)) {
        std::cerr << "ubin_dump: cannot read " << args.file << "\n";
        return 1;
    }

    ubin::Options opt;
    opt.max_depth = args.max_depth;
    opt.preserve_order = !args.hashed;
    opt.strict_duplicate_keys = args.strict_keys;
    opt.reject_trailing = !args.all;

    const std::span<const std::uint8_t> input {data};
    std::size_t base = 0;
    do {
        const auto doc = ubin::decode(input.subspan(base), opt);
        if (!doc.ok()) {
            if (base != 0)
                std::cerr << "value at offset " << base << ":\n";
            std::cerr << ubin::format_error(doc.input(), doc.error());
            return 1;
        }
        std::cout << to_json(doc.root(), args.compact) << "\n";
        base += doc.consumed();
    } while (args.all && base < input.size());

    return 0;
}
