// tests/codec/test_encoder.cpp
#define BOOST_TEST_MODULE EncoderTests
#include <boost/test/unit_test.hpp>
#include <cstdint>
#include <string>
#include <vector>

#include "btoon/codec/codec_error.hpp"
#include "btoon/codec/encoder.hpp"

using namespace btoon::codec;

namespace {

using Bytes = std::vector<uint8_t>;

Bytes encode(const Value& value, EncodeOptions options = {}) {
    return Encoder(std::move(options)).encode(value);
}

// Header bytes of an encoding, without the payload.
Bytes head(const Bytes& encoded, std::size_t n) {
    return Bytes(encoded.begin(), encoded.begin() + n);
}

Value list_of(std::size_t n) { return Value(Value::List(n, Value(0))); }

Value map_of(std::size_t n) {
    Value::Map map;
    for (std::size_t i = 0; i < n; ++i) {
        map.emplace_back(static_cast<int64_t>(i), Value());
    }
    return Value(std::move(map));
}

}  // namespace

#define CHECK_BYTES(actual, ...)                                        \
    do {                                                                \
        const Bytes expected_ = __VA_ARGS__;                            \
        const Bytes actual_ = (actual);                                 \
        BOOST_CHECK_EQUAL_COLLECTIONS(actual_.begin(), actual_.end(),   \
                                      expected_.begin(), expected_.end()); \
    } while (0)

BOOST_AUTO_TEST_SUITE(EncoderScalarSuite)

BOOST_AUTO_TEST_CASE(test_nil_and_bool) {
    CHECK_BYTES(encode(Value()), {0xc0});
    CHECK_BYTES(encode(Value(true)), {0xc3});
    CHECK_BYTES(encode(Value(false)), {0xc2});
}

BOOST_AUTO_TEST_CASE(test_fixint_boundaries) {
    CHECK_BYTES(encode(Value(0)), {0x00});
    CHECK_BYTES(encode(Value(127)), {0x7f});
    CHECK_BYTES(encode(Value(-1)), {0xff});
    CHECK_BYTES(encode(Value(-32)), {0xe0});
}

BOOST_AUTO_TEST_CASE(test_int32_outside_fixint) {
    CHECK_BYTES(encode(Value(128)), {0xd2, 0x00, 0x00, 0x00, 0x80});
    CHECK_BYTES(encode(Value(-33)), {0xd2, 0xff, 0xff, 0xff, 0xdf});
    CHECK_BYTES(encode(Value(2147483647)), {0xd2, 0x7f, 0xff, 0xff, 0xff});
}

BOOST_AUTO_TEST_CASE(test_int32_keeps_low_bits) {
    const int64_t big = (int64_t{1} << 32) + 5;
    CHECK_BYTES(encode(Value(big)), {0xd2, 0x00, 0x00, 0x00, 0x05});
}

BOOST_AUTO_TEST_CASE(test_int64_format) {
    EncodeOptions options;
    options.integer_format = IntegerFormat::Int64;

    const int64_t big = (int64_t{1} << 32) + 5;
    CHECK_BYTES(encode(Value(big), options),
                {0xd3, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x05});
    CHECK_BYTES(encode(Value(int64_t{-1} << 40), options),
                {0xd3, 0xff, 0xff, 0xff, 0x00, 0x00, 0x00, 0x00, 0x00});
    // Values that fit 32 bits keep the shorter form.
    CHECK_BYTES(encode(Value(1000), options), {0xd2, 0x00, 0x00, 0x03, 0xe8});
    CHECK_BYTES(encode(Value(5), options), {0x05});
}

BOOST_AUTO_TEST_CASE(test_float32_default) {
    CHECK_BYTES(encode(Value(1.5)), {0xca, 0x3f, 0xc0, 0x00, 0x00});
    // 0.1 is narrowed to the nearest single.
    CHECK_BYTES(encode(Value(0.1)), {0xca, 0x3d, 0xcc, 0xcc, 0xcd});
}

BOOST_AUTO_TEST_CASE(test_float64_format) {
    EncodeOptions options;
    options.float_format = FloatFormat::Float64;
    CHECK_BYTES(encode(Value(1.5), options),
                {0xcb, 0x3f, 0xf8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00});
}

BOOST_AUTO_TEST_CASE(test_adaptive_float_format) {
    EncodeOptions options;
    options.float_format = FloatFormat::Adaptive;
    CHECK_BYTES(encode(Value(1.5), options), {0xca, 0x3f, 0xc0, 0x00, 0x00});
    CHECK_BYTES(encode(Value(0.1), options),
                {0xcb, 0x3f, 0xb9, 0x99, 0x99, 0x99, 0x99, 0x99, 0x9a});
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(EncoderLengthSuite)

BOOST_AUTO_TEST_CASE(test_text_size_classes) {
    CHECK_BYTES(encode(Value("")), {0xa0});
    CHECK_BYTES(encode(Value("hi")), {0xa2, 'h', 'i'});

    auto fix = encode(Value(std::string(31, 'x')));
    BOOST_CHECK_EQUAL(fix.size(), 32u);
    BOOST_CHECK_EQUAL(fix[0], 0xbf);

    auto str8 = encode(Value(std::string(32, 'x')));
    BOOST_CHECK_EQUAL(str8.size(), 34u);
    CHECK_BYTES(head(str8, 2), {0xd9, 0x20});

    auto str16 = encode(Value(std::string(256, 'x')));
    BOOST_CHECK_EQUAL(str16.size(), 259u);
    CHECK_BYTES(head(str16, 3), {0xda, 0x01, 0x00});

    auto str32 = encode(Value(std::string(65536, 'x')));
    BOOST_CHECK_EQUAL(str32.size(), 65541u);
    CHECK_BYTES(head(str32, 5), {0xdb, 0x00, 0x01, 0x00, 0x00});
}

BOOST_AUTO_TEST_CASE(test_text_is_written_as_raw_utf8) {
    // "é" is two bytes in UTF-8.
    CHECK_BYTES(encode(Value("\xc3\xa9")), {0xa2, 0xc3, 0xa9});
}

BOOST_AUTO_TEST_CASE(test_bytes_size_classes) {
    CHECK_BYTES(encode(Value(Value::Bytes{})), {0xc4, 0x00});
    CHECK_BYTES(encode(Value(Value::Bytes{0x01, 0x02})),
                {0xc4, 0x02, 0x01, 0x02});

    auto bin16 = encode(Value(Value::Bytes(256, 0xaa)));
    BOOST_CHECK_EQUAL(bin16.size(), 259u);
    CHECK_BYTES(head(bin16, 3), {0xc5, 0x01, 0x00});

    auto largest = encode(Value(Value::Bytes(65535, 0xaa)));
    BOOST_CHECK_EQUAL(largest.size(), 65538u);
    CHECK_BYTES(head(largest, 3), {0xc5, 0xff, 0xff});
}

BOOST_AUTO_TEST_CASE(test_bytes_beyond_16_bit_length_are_rejected) {
    BOOST_CHECK_THROW(encode(Value(Value::Bytes(65536, 0xaa))),
                      UnsupportedValueException);

    // Nested too: nothing is left in the output buffer.
    std::vector<uint8_t> out{0x7f};
    BOOST_CHECK_THROW(
        Encoder().encode_to(Value(Value::List{1, Value(Value::Bytes(70000, 0x00))}),
                            out),
        UnsupportedValueException);
    BOOST_CHECK_EQUAL(out.size(), 1u);
}

BOOST_AUTO_TEST_CASE(test_list_size_classes) {
    CHECK_BYTES(encode(Value(Value::List{})), {0x90});
    CHECK_BYTES(encode(Value(Value::List{1, true, Value()})),
                {0x93, 0x01, 0xc3, 0xc0});

    auto fix = encode(list_of(15));
    BOOST_CHECK_EQUAL(fix[0], 0x9f);
    BOOST_CHECK_EQUAL(fix.size(), 16u);

    auto array16 = encode(list_of(16));
    BOOST_CHECK_EQUAL(array16.size(), 19u);
    CHECK_BYTES(head(array16, 3), {0xdc, 0x00, 0x10});

    auto array32 = encode(list_of(65536));
    BOOST_CHECK_EQUAL(array32.size(), 65541u);
    CHECK_BYTES(head(array32, 5), {0xdd, 0x00, 0x01, 0x00, 0x00});
}

BOOST_AUTO_TEST_CASE(test_map_size_classes) {
    CHECK_BYTES(encode(Value(Value::Map{})), {0x80});

    auto fix = encode(map_of(15));
    BOOST_CHECK_EQUAL(fix[0], 0x8f);

    auto map16 = encode(map_of(16));
    CHECK_BYTES(head(map16, 3), {0xde, 0x00, 0x10});
}

BOOST_AUTO_TEST_CASE(test_map_entries_in_insertion_order) {
    Value::Map map;
    map.emplace_back("b", 1);
    map.emplace_back("a", 2);
    CHECK_BYTES(encode(Value(std::move(map))),
                {0x82, 0xa1, 'b', 0x01, 0xa1, 'a', 0x02});
}

BOOST_AUTO_TEST_CASE(test_non_text_map_keys) {
    Value::Map map;
    map.emplace_back(1, "one");
    map.emplace_back(Value(), false);
    CHECK_BYTES(encode(Value(std::move(map))),
                {0x82, 0x01, 0xa3, 'o', 'n', 'e', 0xc0, 0xc2});
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(EncoderOptionsSuite)

BOOST_AUTO_TEST_CASE(test_compression_options_do_not_change_output) {
    Value value(Value::List{1, "two", 3.0});

    EncodeOptions options;
    options.compress = true;
    options.algorithm = "gzip";
    options.level = 9;
    options.auto_tabular = false;

    BOOST_CHECK(encode(value, options) == encode(value));
}

BOOST_AUTO_TEST_CASE(test_max_depth) {
    Value nested(Value::List{Value(Value::List{1})});

    EncodeOptions options;
    options.max_depth = 1;
    BOOST_CHECK_THROW(encode(nested, options), UnsupportedValueException);

    options.max_depth = 2;
    CHECK_BYTES(encode(nested, options), {0x91, 0x91, 0x01});
}

BOOST_AUTO_TEST_CASE(test_encode_to_appends_and_rolls_back) {
    EncodeOptions options;
    options.max_depth = 1;
    Encoder encoder(options);

    Bytes out{0xee};
    encoder.encode_to(Value(true), out);
    CHECK_BYTES(out, {0xee, 0xc3});

    Value nested(Value::List{1, Value(Value::List{})});
    BOOST_CHECK_THROW(encoder.encode_to(nested, out), CodecException);
    CHECK_BYTES(out, {0xee, 0xc3});
}

BOOST_AUTO_TEST_CASE(test_error_code) {
    EncodeOptions options;
    options.max_depth = 1;
    try {
        encode(Value(Value::List{Value(Value::Map{})}), options);
        BOOST_FAIL("expected UnsupportedValueException");
    } catch (const CodecException& e) {
        BOOST_CHECK(e.code() == CodecError::UnsupportedValue);
    }
}

BOOST_AUTO_TEST_SUITE_END()
