#include <catch2/catch.hpp>
#include "charset.hpp"

#include <vector>

TEST_CASE("charset_t set and test", "[charset]")
{
    charset_t cs;
    REQUIRE(cs.all_clear());
    REQUIRE(!cs);

    cs.set('a');
    cs.set(0);
    cs.set(255);
    REQUIRE(cs.test('a'));
    REQUIRE(cs.test(0));
    REQUIRE(cs.test(255));
    REQUIRE(!cs.test('b'));
    REQUIRE(cs.popcount() == 3);
    REQUIRE(cs.lowest() == 0);

    cs.clear(0);
    REQUIRE(cs.lowest() == 'a');
}

TEST_CASE("charset_t set algebra", "[charset]")
{
    charset_t const lower = charset_t::range('a', 'z');
    charset_t const vowels = charset_t::single('a') | charset_t::single('e') | charset_t::single('i')
                           | charset_t::single('o') | charset_t::single('u');

    REQUIRE((lower & vowels) == vowels);
    REQUIRE((lower - vowels).popcount() == 21);
    REQUIRE(!(vowels - lower));
    REQUIRE((~lower).popcount() == 256 - 26);
    REQUIRE((lower | ~lower).all_set());
    REQUIRE(charset_t::full().popcount() == 256);
}

TEST_CASE("charset_t ranges", "[charset]")
{
    charset_t cs = charset_t::range('0', '9') | charset_t::range('a', 'f') | charset_t::single('_');

    std::vector<byte_range_t> ranges;
    cs.for_each_range([&](byte_range_t r) { ranges.push_back(r); });

    REQUIRE(ranges.size() == 3);
    REQUIRE(ranges[0] == byte_range_t{ '0', '9' });
    REQUIRE(ranges[1] == byte_range_t{ '_', '_' });
    REQUIRE(ranges[2] == byte_range_t{ 'a', 'f' });

    unsigned count = 0;
    cs.for_each([&](unsigned char) { ++count; });
    REQUIRE(count == cs.popcount());
}

TEST_CASE("charset_t to_string", "[charset]")
{
    REQUIRE(charset_t::range('a', 'z').to_string() == "[a-z]");
    REQUIRE((charset_t::range('a', 'b') | charset_t::single('_')).to_string() == "[_ab]");
    REQUIRE(charset_t::single('\n').to_string() == "[\\n]");
    REQUIRE(charset_t::single('-').to_string() == "[\\-]");
    REQUIRE(charset_t::full().to_string() == "[\\x00-\\xff]");
    REQUIRE(byte_to_string(0x80) == "\\x80");
}
