#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "xjb-core/arena.hh"
#include "xjb-core/value.hh"

///
/// VALUE TESTS
///

namespace {

    struct Counter {
        int* drops;
        int hits;

        Counter(int* drops_, int hits_): drops(drops_), hits(hits_) {}
        Counter(Counter const& other): drops(other.drops), hits(other.hits) {}
        ~Counter() { ++*drops; }
        bool operator==(Counter const& other) const { return hits == other.hits; }
    };

    struct Handle {
        std::unique_ptr<int> fd;
    };

    std::string printed(xjb::Value const& v) {
        std::stringstream ss;
        ss << v;
        return ss.str();
    }

}

TEST(ValueTests1, ScalarRoundTrips) {
    xjb::Value v = xjb::Value::make_void();
    EXPECT_EQ(v.tag(), xjb::ValueTag::Void);
    EXPECT_TRUE(v.is_void());

    xjb::Value b = xjb::Value::from_bool(true);
    EXPECT_TRUE(b.is_bool());
    EXPECT_EQ(b.as_bool().value(), true);

    xjb::Value i = xjb::Value::from_int(std::numeric_limits<int64_t>::min());
    EXPECT_TRUE(i.is_int());
    EXPECT_EQ(i.as_int().value(), std::numeric_limits<int64_t>::min());

    xjb::Value f = xjb::Value::from_float(-2.5);
    EXPECT_TRUE(f.is_float());
    EXPECT_TRUE(f.is_number());
    EXPECT_EQ(f.as_float().value(), -2.5);

    EXPECT_FALSE(i.is_owning());
    EXPECT_TRUE(i.payload().is_null());
    EXPECT_EQ(sizeof(xjb::Value), 32);
}

TEST(ValueTests1, ShortStringsStayInline) {
    std::string const fits(xjb::Value::INLINE_STRING_CAPACITY, 'x');
    std::string const spills(xjb::Value::INLINE_STRING_CAPACITY + 1, 'y');

    xjb::Value empty = xjb::Value::from_string("");
    EXPECT_EQ(empty.tag(), xjb::ValueTag::InlineString);
    EXPECT_EQ(empty.as_str().value(), "");

    xjb::Value inline_str = xjb::Value::from_string(fits);
    EXPECT_EQ(inline_str.tag(), xjb::ValueTag::InlineString);
    EXPECT_EQ(inline_str.as_str().value(), fits);
    EXPECT_FALSE(inline_str.is_owning());

    xjb::Value heap_str = xjb::Value::from_string(spills);
    EXPECT_EQ(heap_str.tag(), xjb::ValueTag::HeapString);
    EXPECT_EQ(heap_str.as_str().value(), spills);
    EXPECT_TRUE(heap_str.is_owning());
    EXPECT_TRUE(heap_str.is_string());
    EXPECT_EQ(heap_str.length().value(), spills.size());

    // embedded NULs are kept
    std::string const with_nul{"a\0b", 3};
    EXPECT_EQ(xjb::Value::from_string(with_nul).as_str().value(), with_nul);
}

TEST(ValueTests1, ContainersRoundTrip) {
    xjb::ValueArray elements;
    elements.push_back(xjb::Value::from_int(1));
    elements.push_back(xjb::Value::from_string("two"));
    elements.push_back(xjb::Value::from_float(3.0));
    xjb::Value array = xjb::Value::from_array(std::move(elements));

    EXPECT_EQ(array.tag(), xjb::ValueTag::Array);
    EXPECT_TRUE(array.is_owning());
    xjb::ValueArray const* items = array.as_array().value();
    ASSERT_EQ(items->size(), 3);
    EXPECT_EQ((*items)[0].as_int().value(), 1);
    EXPECT_EQ((*items)[1].as_str().value(), "two");
    EXPECT_EQ((*items)[2].as_float().value(), 3.0);

    // mutable access through the owning Value
    array.as_array().value()->push_back(xjb::Value::from_bool(false));
    EXPECT_EQ(array.length().value(), 4);

    xjb::ValueObject fields;
    fields.emplace("name", xjb::Value::from_string("xjb"));
    fields.emplace("list", std::move(array));
    xjb::Value object = xjb::Value::from_object(std::move(fields));
    EXPECT_EQ(object.tag(), xjb::ValueTag::Object);
    xjb::ValueObject const* obj = object.as_object().value();
    ASSERT_EQ(obj->size(), 2);
    EXPECT_EQ(obj->at("name").as_str().value(), "xjb");
    EXPECT_EQ(obj->at("list").length().value(), 4);
}

#if !XJB_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS

TEST(ValueTests1, MismatchesAreReportedNotFatal) {
    xjb::Value i = xjb::Value::from_int(7);

    xjb::Result<bool> as_bool = i.as_bool();
    ASSERT_FALSE(as_bool.ok());
    EXPECT_EQ(as_bool.error().kind(), xjb::ErrorKind::TypeMismatch);
    EXPECT_EQ(as_bool.error().expected(), xjb::ValueTag::Bool);
    EXPECT_EQ(as_bool.error().actual(), xjb::ValueTag::Int);

    EXPECT_FALSE(i.as_float().ok());
    EXPECT_FALSE(i.as_array().ok());
    EXPECT_FALSE(i.as_object().ok());
    EXPECT_EQ(i.as_str().error().expected(), xjb::ValueTag::HeapString);
    EXPECT_EQ(i.as_foreign<Handle>().error().kind(), xjb::ErrorKind::TypeMismatch);

    xjb::Value s = xjb::Value::from_string("not a number");
    EXPECT_EQ(s.as_int().error().actual(), xjb::ValueTag::InlineString);
    EXPECT_FALSE(xjb::Value::make_void().as_bool().ok());

    // asking for the value of a failed result throws the same error
    EXPECT_THROW(s.as_int().value(), xjb::Error);
    EXPECT_EQ(s.as_int().value_or(-1), -1);
}

TEST(ValueTests1, ForeignDowncastChecksDescriptor) {
    int drops = 0;
    xjb::Value v = xjb::Value::make_foreign<Counter>(xjb::heap_allocator(), &drops, 3);
    EXPECT_TRUE(v.as_foreign<Counter>().ok());

    xjb::Result<Handle*> wrong = v.as_foreign<Handle>();
    ASSERT_FALSE(wrong.ok());
    EXPECT_EQ(wrong.error().kind(), xjb::ErrorKind::TypeMismatch);
    EXPECT_EQ(wrong.error().expected(), xjb::ValueTag::Foreign);
    EXPECT_EQ(wrong.error().actual(), xjb::ValueTag::Foreign);
}

#endif

TEST(ValueTests1, OwningForeignRunsDestructorOnce) {
    int drops = 0;
    {
        xjb::Value v = xjb::Value::make_foreign<Counter>(xjb::heap_allocator(), &drops, 3);
        EXPECT_TRUE(v.is_foreign());
        EXPECT_TRUE(v.is_owning());
        EXPECT_EQ(v.as_foreign<Counter>().value()->hits, 3);

        xjb::Value moved{std::move(v)};
        EXPECT_TRUE(v.is_void());
        EXPECT_EQ(drops, 0);
    }
    EXPECT_EQ(drops, 1);
}

TEST(ValueTests1, OverwritingDropsOldPayload) {
    int drops = 0;
    xjb::Value slot = xjb::Value::make_foreign<Counter>(xjb::heap_allocator(), &drops, 1);
    slot = xjb::Value::from_int(5);
    EXPECT_EQ(drops, 1);
    EXPECT_EQ(slot.as_int().value(), 5);
}

TEST(ValueTests1, MovesAreNoexcept) {
    static_assert(std::is_nothrow_move_constructible_v<xjb::Value>);
    static_assert(std::is_nothrow_move_assignable_v<xjb::Value>);

    // reallocation moves owning Values: each payload is still destroyed once
    int drops = 0;
    {
        std::vector<xjb::Value> values;
        for (int i = 0; i < 20; i++) {
            values.push_back(xjb::Value::make_foreign<Counter>(xjb::heap_allocator(), &drops, i));
        }
        EXPECT_EQ(drops, 0);
        EXPECT_EQ(values[7].as_foreign<Counter>().value()->hits, 7);
    }
    EXPECT_EQ(drops, 20);
}

TEST(ValueTests1, BorrowingNeverDestroys) {
    int drops = 0;
    {
        Counter owned{&drops, 8};
        {
            xjb::Value borrowed = xjb::Value::borrow(xjb::WidePtr::make(&owned));
            EXPECT_TRUE(borrowed.is_foreign());
            EXPECT_FALSE(borrowed.is_owning());
            EXPECT_EQ(borrowed.payload_allocator(), nullptr);
            EXPECT_EQ(borrowed.as_foreign<Counter>().value(), &owned);

            xjb::Result<xjb::Value> copy = borrowed.clone();
            ASSERT_TRUE(copy.ok());
            EXPECT_FALSE(copy.value().is_owning());
            EXPECT_EQ(copy.value().payload(), borrowed.payload());
        }
        EXPECT_EQ(drops, 0);
    }
    // only the stack object itself
    EXPECT_EQ(drops, 1);

    std::string text(40, 'z');
    xjb::Value borrowed_str = xjb::Value::borrow(xjb::WidePtr::make(&text));
    EXPECT_EQ(borrowed_str.tag(), xjb::ValueTag::HeapString);
    EXPECT_EQ(borrowed_str.as_str().value(), text);
}

TEST(ValueTests1, OwnInfersTagFromDescriptor) {
    xjb::Value s = xjb::Value::own(xjb::Korobka::make<std::string>("boxed"));
    EXPECT_EQ(s.tag(), xjb::ValueTag::HeapString);
    // inline and heap strings with the same bytes are equal
    EXPECT_EQ(s, xjb::Value::from_string("boxed"));

    xjb::Value a = xjb::Value::own(xjb::Korobka::make<xjb::ValueArray>());
    EXPECT_EQ(a.tag(), xjb::ValueTag::Array);
    EXPECT_EQ(a.length().value(), 0);

    xjb::Value h = xjb::Value::own(xjb::Korobka::make<Handle>());
    EXPECT_EQ(h.tag(), xjb::ValueTag::Foreign);

    EXPECT_TRUE(xjb::Value::own(xjb::Korobka{}).is_void());
}

TEST(ValueTests1, CloneIsDeep) {
    xjb::ValueArray inner;
    inner.push_back(xjb::Value::from_string(std::string(30, 'q')));
    xjb::ValueArray outer;
    outer.push_back(xjb::Value::from_array(std::move(inner)));
    outer.push_back(xjb::Value::from_int(2));
    xjb::Value original = xjb::Value::from_array(std::move(outer));

    xjb::Result<xjb::Value> copy = original.clone();
    ASSERT_TRUE(copy.ok());
    EXPECT_EQ(copy.value(), original);
    EXPECT_NE(copy.value().payload().data(), original.payload().data());

    // mutating the copy leaves the original alone
    copy.value().as_array().value()->push_back(xjb::Value::make_void());
    EXPECT_NE(copy.value(), original);
    EXPECT_EQ(original.length().value(), 2);
}

TEST(ValueTests1, CloneFailsOnUncopyablePayload) {
    xjb::ValueArray elements;
    elements.push_back(xjb::Value::from_int(1));
    elements.push_back(xjb::Value::make_foreign<Handle>(xjb::heap_allocator(), Handle{std::make_unique<int>(4)}));
    xjb::Value array = xjb::Value::from_array(std::move(elements));

    xjb::Result<xjb::Value> copy = array.clone();
    ASSERT_FALSE(copy.ok());
    EXPECT_EQ(copy.error().kind(), xjb::ErrorKind::NotCloneable);
}

TEST(ValueTests1, Equality) {
    EXPECT_EQ(xjb::Value::from_int(3), xjb::Value::from_int(3));
    EXPECT_NE(xjb::Value::from_int(3), xjb::Value::from_float(3.0));
    EXPECT_EQ(xjb::Value::make_void(), xjb::Value::make_void());
    EXPECT_NE(xjb::Value::from_bool(true), xjb::Value::from_bool(false));

    int drops = 0;
    xjb::Value c1 = xjb::Value::make_foreign<Counter>(xjb::heap_allocator(), &drops, 2);
    xjb::Value c2 = xjb::Value::make_foreign<Counter>(xjb::heap_allocator(), &drops, 2);
    xjb::Value c3 = xjb::Value::make_foreign<Counter>(xjb::heap_allocator(), &drops, 9);
    EXPECT_EQ(c1, c2);
    EXPECT_NE(c1, c3);

    // no '==' on Handle: identity
    xjb::Value h1 = xjb::Value::make_foreign<Handle>(xjb::heap_allocator());
    xjb::Value h2 = xjb::Value::make_foreign<Handle>(xjb::heap_allocator());
    xjb::Value h1_borrow = xjb::Value::borrow(h1.payload());
    EXPECT_NE(h1, h2);
    EXPECT_EQ(h1, h1_borrow);
}

TEST(ValueTests1, Coercions) {
    EXPECT_EQ(xjb::Value::from_int(4).to_float().value(), 4.0);
    EXPECT_EQ(xjb::Value::from_float(4.0).to_int().value(), 4);
    EXPECT_EQ(xjb::Value::from_float(-0.5).to_int().error().kind(), xjb::ErrorKind::TypeMismatch);
    EXPECT_FALSE(xjb::Value::from_float(1e300).to_int().ok());
    EXPECT_FALSE(xjb::Value::from_float(std::nan("")).to_int().ok());
    EXPECT_FALSE(xjb::Value::from_string("4").to_float().ok());

    EXPECT_FALSE(xjb::Value::make_void().is_truthy());
    EXPECT_FALSE(xjb::Value::from_bool(false).is_truthy());
    EXPECT_TRUE(xjb::Value::from_int(0).is_truthy());
    EXPECT_TRUE(xjb::Value::from_string("").is_truthy());

    EXPECT_FALSE(xjb::Value::from_int(1).length().ok());
}

TEST(ValueTests1, ArenaBackedValues) {
    xjb::Arena arena{512};
    {
        xjb::ValueArray elements;
        elements.push_back(xjb::Value::from_string(std::string(64, 'a'), arena));
        xjb::Value array = xjb::Value::from_array(std::move(elements), arena);
        EXPECT_TRUE(array.is_owning());
        EXPECT_EQ(array.payload_allocator(), &arena);
        EXPECT_TRUE(arena.owns(array.payload().data()));

        xjb::Value const& first = (*array.as_array().value())[0];
        EXPECT_TRUE(arena.owns(first.payload().data()));
        EXPECT_EQ(first.length().value(), 64);

        // clones of arena values land in the same arena
        xjb::Result<xjb::Value> copy = array.clone();
        ASSERT_TRUE(copy.ok());
        EXPECT_EQ(copy.value().payload_allocator(), &arena);
    }
    EXPECT_GE(arena.block_count(), 1);
}

TEST(ValueTests1, Printing) {
    EXPECT_EQ(printed(xjb::Value::make_void()), "void");
    EXPECT_EQ(printed(xjb::Value::from_bool(true)), "true");
    EXPECT_EQ(printed(xjb::Value::from_int(-12)), "-12");
    EXPECT_EQ(printed(xjb::Value::from_float(2.0)), "2.0");
    EXPECT_EQ(printed(xjb::Value::from_float(0.25)), "0.25");
    EXPECT_EQ(printed(xjb::Value::from_string("a\"b\n")), "\"a\\\"b\\n\"");

    xjb::ValueArray elements;
    elements.push_back(xjb::Value::from_int(1));
    elements.push_back(xjb::Value::from_string("x"));
    elements.push_back(xjb::Value::from_array({}));
    EXPECT_EQ(printed(xjb::Value::from_array(std::move(elements))), "[1, \"x\", []]");

    xjb::ValueObject fields;
    fields.emplace("k", xjb::Value::from_bool(false));
    EXPECT_EQ(printed(xjb::Value::from_object(std::move(fields))), "{\"k\": false}");

    xjb::register_type<Handle>("test.value.Handle");
    std::string foreign = printed(xjb::Value::make_foreign<Handle>(xjb::heap_allocator()));
    EXPECT_EQ(foreign.rfind("#<foreign test.value.Handle @", 0), 0);
}
