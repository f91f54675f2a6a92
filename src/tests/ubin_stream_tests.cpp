#include <catch2/catch_test_macros.hpp>

#include <ubin/ubin.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace ubin;

using Bytes = std::vector<std::uint8_t>;

namespace {

    struct RecordingHandler {
        std::vector<std::string> events;
        std::string reject_on;

        bool record(std::string e) {
            const bool accept = e != reject_on;
            events.push_back(std::move(e));
            return accept;
        }

        bool on_null() {
            return record("null");
        }

        bool on_unit() {
            return record("unit");
        }

        bool on_bool(const bool b) {
            return record(b ? "true" : "false");
        }

        bool on_int(const std::int64_t v) {
            return record("i:" + std::to_string(v));
        }

        bool on_uint(const std::uint64_t v) {
            return record("u:" + std::to_string(v));
        }

        bool on_f32(const float v) {
            std::ostringstream ss;
            ss << "f32:" << v;
            return record(ss.str());
        }

        bool on_f64(const double v) {
            std::ostringstream ss;
            ss << "f64:" << v;
            return record(ss.str());
        }

        bool on_bytes(const std::span<const std::uint8_t> v) {
            return record("bytes:" + std::to_string(v.size()));
        }

        bool on_string(const std::string_view s) {
            return record("str:" + std::string(s));
        }

        bool on_seq_begin(const std::uint32_t n) {
            return record("[" + std::to_string(n));
        }

        bool on_seq_end() {
            return record("]");
        }

        bool on_map_begin(const std::uint32_t n) {
            return record("{" + std::to_string(n));
        }

        bool on_map_end() {
            return record("}");
        }
    };

    static_assert(SaxHandler<RecordingHandler>);

    Bytes sample_stream() {
        VectorSink sink;
        Encoder enc {sink};

        REQUIRE(enc.begin_seq(9));
        REQUIRE(enc.write_null());
        REQUIRE(enc.write_unit());
        REQUIRE(enc.write_bool(true));
        REQUIRE(enc.write_int(-5));
        REQUIRE(enc.write_uint(300));
        REQUIRE(enc.write_f32(1.5f));
        REQUIRE(enc.write_f64(2.25));
        REQUIRE(enc.write_bytes(Bytes {1, 2, 3}));
        REQUIRE(enc.begin_map(1));
        REQUIRE(enc.write_string("k"));
        REQUIRE(enc.begin_seq(0));
        REQUIRE(enc.end_container());
        REQUIRE(enc.end_container());
        REQUIRE(enc.end_container());
        REQUIRE(enc.complete());

        return sink.finish();
    }

} // namespace

TEST_CASE("sax decoder emits events in order", "[ubin][sax]") {
    const auto bytes = sample_stream();

    RecordingHandler h;
    SaxDecoder sax {h, bytes};
    const auto err = sax.decode();
    REQUIRE(err.ok());
    REQUIRE(sax.consumed() == bytes.size());

    const std::vector<std::string> expected {
        "[9", "null", "unit", "true", "i:-5", "u:300", "f32:1.5", "f64:2.25", "bytes:3", "{1", "str:k", "[0", "]", "}", "]",
    };
    REQUIRE(h.events == expected);
}

TEST_CASE("sax handler rejection stops decoding", "[ubin][sax]") {
    const auto bytes = sample_stream();

    RecordingHandler h;
    h.reject_on = "u:300";
    SaxDecoder sax {h, bytes};
    const auto err = sax.decode();

    REQUIRE(err.code == ErrorCode::HandlerRejected);
    // seq header, null, unit, true, -5 precede it
    REQUIRE(err.offset == 5);
    REQUIRE(h.events.back() == "u:300");
}

TEST_CASE("sax decoder honours depth and allocation options", "[ubin][sax]") {
    const Bytes deep {0x31, 0x31, 0x30};

    RecordingHandler h;
    SaxDecoder limited {h, deep, Options {.max_depth = 2}};
    const auto err = limited.decode();
    REQUIRE(err.code == ErrorCode::DepthExceeded);
    REQUIRE(err.offset == 2);

    RecordingHandler h2;
    SaxDecoder no_heap {h2, deep, Options {.allow_alloc = false}};
    REQUIRE(no_heap.decode().code == ErrorCode::AllocationDisallowed);

    RecordingHandler h3;
    StaticBufferAllocator<8192, 1024> alloc;
    SaxDecoder fixed {h3, deep, alloc, Options {.allow_alloc = false}};
    REQUIRE(fixed.decode().ok());
    REQUIRE(h3.events.size() == 6);
}

TEST_CASE("reader walks a stream", "[ubin][reader]") {
    const auto bytes = sample_stream();
    Reader r {bytes};

    std::uint64_t n = 0;
    REQUIRE(r.peek_marker() == Marker::Seq);
    REQUIRE(r.begin_seq(n));
    REQUIRE(n == 9);
    REQUIRE(r.depth() == 1);

    REQUIRE(r.read_null());
    REQUIRE(r.read_unit());

    bool b = false;
    REQUIRE(r.read_bool(b));
    REQUIRE(b);

    std::int64_t i = 0;
    REQUIRE(r.read_int(i));
    REQUIRE(i == -5);

    std::uint64_t u = 0;
    REQUIRE(r.read_uint(u));
    REQUIRE(u == 300);

    double d = 0;
    REQUIRE(r.read_f64(d));
    REQUIRE(d == 1.5);
    REQUIRE(r.read_f64(d));
    REQUIRE(d == 2.25);

    std::span<const std::uint8_t> blob;
    REQUIRE(r.read_bytes(blob));
    REQUIRE(blob.size() == 3);
    REQUIRE(blob[2] == 3);

    REQUIRE(r.begin_map(n));
    REQUIRE(n == 1);

    std::string_view key;
    REQUIRE(r.read_string(key));
    REQUIRE(key == "k");

    REQUIRE(r.begin_seq(n));
    REQUIRE(n == 0);
    REQUIRE(r.end_container());
    REQUIRE(r.end_container());
    REQUIRE(r.end_container());

    REQUIRE(r.at_end());
    REQUIRE_FALSE(r.peek_marker().has_value());
    REQUIRE(r.ok());
}

TEST_CASE("reader header and scalar primitives", "[ubin][reader]") {
    const Bytes in {0x81, 0x01, 0x2C, 0x63, 'a', 'b', 'c', 0x32, 0xC1, 0xC2};
    Reader r {in};

    Header h;
    Scalar s;
    REQUIRE(r.read_header(h));
    REQUIRE(h.marker == Marker::Int);
    REQUIRE_FALSE(h.compact);
    REQUIRE(h.width == 2);
    REQUIRE(r.read_scalar(h, s));
    REQUIRE(s.type == Type::Int);
    REQUIRE(s.i.to_u64() == 300u);

    REQUIRE(r.read_scalar(s));
    REQUIRE(s.type == Type::String);
    REQUIRE(s.str == "abc");

    REQUIRE(r.read_header(h));
    REQUIRE(h.marker == Marker::Seq);
    REQUIRE_FALSE(r.read_scalar(h, s));
    REQUIRE(r.error().code == ErrorCode::TypeMismatch);
    REQUIRE(r.error().offset == 7);
}

TEST_CASE("reader type mismatch leaves the position at the header", "[ubin][reader]") {
    const Bytes in {0x63, 'a', 'b', 'c'};
    Reader r {in};

    std::int64_t i = 0;
    REQUIRE_FALSE(r.read_int(i));
    REQUIRE(r.error().code == ErrorCode::TypeMismatch);
    REQUIRE(r.error().offset == 0);
    REQUIRE(r.pos() == 0);

    std::string_view s;
    REQUIRE_FALSE(r.read_string(s));
}

TEST_CASE("reader number range checks", "[ubin][reader]") {
    const Bytes big {0x87, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    Reader r1 {big};
    std::int64_t i = 0;
    REQUIRE_FALSE(r1.read_int(i));
    REQUIRE(r1.error().code == ErrorCode::NumberOutOfRange);

    const Bytes neg {0xE1};
    Reader r2 {neg};
    std::uint64_t u = 0;
    REQUIRE_FALSE(r2.read_uint(u));
    REQUIRE(r2.error().code == ErrorCode::NumberOutOfRange);

    Reader r3 {neg};
    REQUIRE(r3.read_int(i));
    REQUIRE(i == -1);
}

TEST_CASE("reader skip_value", "[ubin][reader]") {
    const auto bytes = sample_stream();

    Bytes twice = bytes;
    twice.insert(twice.end(), bytes.begin(), bytes.end());

    Reader r {twice};
    REQUIRE(r.skip_value());
    REQUIRE(r.pos() == bytes.size());
    REQUIRE(r.skip_value());
    REQUIRE(r.at_end());

    const Bytes cut(bytes.begin(), bytes.end() - 1);
    Reader t {cut};
    REQUIRE_FALSE(t.skip_value());
    REQUIRE(t.error().code == ErrorCode::UnexpectedEof);
    REQUIRE(t.error().offset == cut.size());
}

TEST_CASE("reader depth guard", "[ubin][reader]") {
    const Bytes in {0x31, 0x31, 0x30};
    Reader r {in, Options {.max_depth = 2}};

    std::uint64_t n = 0;
    REQUIRE(r.begin_seq(n));
    REQUIRE(r.begin_seq(n));
    REQUIRE_FALSE(r.begin_seq(n));
    REQUIRE(r.error().code == ErrorCode::DepthExceeded);
    REQUIRE(r.error().offset == 2);

    Reader under {in};
    REQUIRE_FALSE(under.end_container());
    REQUIRE(under.error().code == ErrorCode::ContainerUnderflow);
}

TEST_CASE("encoder checks declared counts", "[ubin][encoder]") {
    SECTION("too few") {
        VectorSink sink;
        Encoder enc {sink};
        REQUIRE(enc.begin_seq(2));
        REQUIRE(enc.write_null());
        REQUIRE_FALSE(enc.end_container());
        REQUIRE(enc.error().code == ErrorCode::LengthMismatch);
    }

    SECTION("too many") {
        VectorSink sink;
        Encoder enc {sink};
        REQUIRE(enc.begin_map(1));
        REQUIRE(enc.write_string("k"));
        REQUIRE(enc.write_null());
        REQUIRE_FALSE(enc.write_null());
        REQUIRE(enc.error().code == ErrorCode::LengthMismatch);
        REQUIRE(enc.error().offset == 4);
    }

    SECTION("underflow") {
        VectorSink sink;
        Encoder enc {sink};
        REQUIRE_FALSE(enc.end_container());
        REQUIRE(enc.error().code == ErrorCode::ContainerUnderflow);
    }

    SECTION("open containers") {
        VectorSink sink;
        Encoder enc {sink};
        REQUIRE(enc.begin_seq(1));
        REQUIRE(enc.open_containers() == 1);
        REQUIRE_FALSE(enc.complete());
    }

    SECTION("errors are sticky") {
        VectorSink sink;
        Encoder enc {sink};
        REQUIRE_FALSE(enc.write_string("\xC3\x28"));
        REQUIRE(enc.error().code == ErrorCode::InvalidUtf8);
        REQUIRE_FALSE(enc.write_null());
        REQUIRE(enc.written() == 0);
    }

    SECTION("containers are not scalars") {
        VectorSink sink;
        Encoder enc {sink};
        Scalar s;
        s.type = Type::Seq;
        REQUIRE_FALSE(enc.write_scalar(s));
        REQUIRE(enc.error().code == ErrorCode::TypeMismatch);
    }
}

TEST_CASE("streaming output matches tree output", "[ubin][encoder]") {
    ValueBuilder b;
    Node* root = b.map();
    Node* list = b.seq();
    REQUIRE(b.push(list, b.integer(-1)));
    REQUIRE(b.push(list, b.string("x")));
    REQUIRE(b.insert(root, "list", list));
    REQUIRE(b.insert(root, "flag", b.boolean(false)));
    b.set_root(root);

    VectorSink tree_sink;
    REQUIRE(encode(b.root(), tree_sink).ok());

    VectorSink sink;
    Encoder enc {sink};
    REQUIRE(enc.begin_map(2));
    REQUIRE(enc.write_scalar(Scalar::string("list")));
    REQUIRE(enc.begin_seq(2));
    REQUIRE(enc.write_scalar(Scalar::integer(-1)));
    REQUIRE(enc.write_scalar(Scalar::string("x")));
    REQUIRE(enc.end_container());
    REQUIRE(enc.write_scalar(Scalar::string("flag")));
    REQUIRE(enc.write_scalar(Scalar::boolean(false)));
    REQUIRE(enc.end_container());
    REQUIRE(enc.complete());

    REQUIRE(sink.out == tree_sink.out);
}

TEST_CASE("tree written inside a streamed container counts once", "[ubin][encoder]") {
    ValueBuilder b;
    Node* list = b.seq();
    REQUIRE(b.push(list, b.uinteger(1)));
    REQUIRE(b.push(list, b.uinteger(2)));
    b.set_root(list);

    VectorSink sink;
    Encoder enc {sink};
    REQUIRE(enc.begin_seq(2));
    REQUIRE(enc.write(b.root()));
    REQUIRE(enc.write_unit());
    REQUIRE(enc.end_container());
    REQUIRE(enc.complete());

    auto doc = decode(sink.out);
    REQUIRE(doc.ok());
    REQUIRE(doc.root().size() == 2);
    REQUIRE(doc.root()[0] == b.root());
}

TEST_CASE("tree depth counts the streamed containers around it", "[ubin][encoder]") {
    // [[]] written inside an open seq nests three deep
    ValueBuilder b;
    Node* outer = b.seq();
    REQUIRE(b.push(outer, b.seq()));
    b.set_root(outer);

    SECTION("over the limit") {
        VectorSink sink;
        Encoder enc {sink, {.max_depth = 2}};
        REQUIRE(enc.begin_seq(1));
        REQUIRE_FALSE(enc.write(b.root()));
        REQUIRE(enc.error().code == ErrorCode::DepthExceeded);
        REQUIRE(enc.error().offset == 2);
    }

    SECTION("at the limit") {
        VectorSink sink;
        Encoder enc {sink, {.max_depth = 3}};
        REQUIRE(enc.begin_seq(1));
        REQUIRE(enc.write(b.root()));
        REQUIRE(enc.end_container());
        REQUIRE(enc.complete());

        REQUIRE(decode(sink.out, {.max_depth = 3}).ok());
        REQUIRE(decode(sink.out, {.max_depth = 2}).error().code == ErrorCode::DepthExceeded);
    }
}

TEST_CASE("raw header writes for bridge code", "[ubin][encoder]") {
    VectorSink sink;
    Encoder enc {sink};
    const std::string_view payload = "hello";
    REQUIRE(enc.write_header(Header::string(payload.size())));
    REQUIRE(enc.write_raw(std::span<const std::uint8_t> {reinterpret_cast<const std::uint8_t*>(payload.data()), payload.size()}));

    auto doc = decode(sink.out);
    REQUIRE(doc.ok());
    REQUIRE(doc.root().as_string() == "hello");
}

TEST_CASE("fixed sink rejects writes whole", "[ubin][sink]") {
    std::uint8_t buf[3] {};
    FixedBufferSink sink {buf, sizeof(buf)};
    Encoder enc {sink};

    REQUIRE(enc.write_uint(300));
    REQUIRE_FALSE(enc.write_uint(1));
    REQUIRE(enc.error().code == ErrorCode::BufferCapacityExceeded);
    REQUIRE(enc.error().offset == 3);
    REQUIRE(sink.finish().size() == 3);
}
