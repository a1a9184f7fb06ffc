#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "config/config.hh"
#include "xjb-core/value.hh"
#include "xjb-core/wide-ptr.hh"

///
/// TYPE CHECK MODE TESTS
/// - built twice: once per value of XJB_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS
///

namespace {

    struct Meters {
        double v;
    };

    struct Seconds {
        double v;
    };

}

TEST(TypeCheckModeTests, TagCorrectAccessorsReturnPayloads) {
    EXPECT_TRUE(xjb::Value::from_bool(true).as_bool().value());
    EXPECT_EQ(xjb::Value::from_int(-9).as_int().value(), -9);
    EXPECT_EQ(xjb::Value::from_float(0.5).as_float().value(), 0.5);
    EXPECT_EQ(xjb::Value::from_string("inline").as_str().value(), "inline");

    std::string long_text(64, 'q');
    EXPECT_EQ(xjb::Value::from_string(long_text).as_str().value(), long_text);

    xjb::ValueArray elements;
    elements.push_back(xjb::Value::from_int(1));
    xjb::Value array = xjb::Value::from_array(std::move(elements));
    EXPECT_EQ(array.as_array().value()->size(), 1);

    xjb::ValueObject fields;
    fields.emplace("k", xjb::Value::from_bool(false));
    xjb::Value object = xjb::Value::from_object(std::move(fields));
    EXPECT_EQ(object.as_object().value()->count("k"), 1);

    xjb::Value meters = xjb::Value::make_foreign<Meters>(xjb::heap_allocator(), Meters{3.0});
    EXPECT_EQ(meters.as_foreign<Meters>().value()->v, 3.0);
}

TEST(TypeCheckModeTests, CheckedPathsStayCheckedInEveryMode) {
    Meters m{1.0};
    xjb::WidePtr ptr = xjb::WidePtr::make(&m);
    EXPECT_EQ(ptr.try_downcast<Meters>(), &m);
    EXPECT_EQ(ptr.try_downcast<Seconds>(), nullptr);
    EXPECT_TRUE(ptr.is<Meters>());
    EXPECT_FALSE(ptr.is<Seconds>());

    // coercions dispatch on the tag
    xjb::Result<int64_t> coerced = xjb::Value::from_string("12").to_int();
    ASSERT_FALSE(coerced.ok());
    EXPECT_EQ(coerced.error().kind(), xjb::ErrorKind::TypeMismatch);
}

#if XJB_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS

TEST(TypeCheckModeTests, UncheckedDowncastSkipsDescriptorCheck) {
    Meters m{2.0};
    xjb::WidePtr ptr = xjb::WidePtr::make(&m);
    // the caller vouches for the type: the data pointer comes back as-is
    EXPECT_EQ(static_cast<void*>(ptr.downcast<Seconds>()), static_cast<void*>(&m));

    xjb::Value meters = xjb::Value::make_foreign<Meters>(xjb::heap_allocator(), Meters{4.0});
    xjb::Result<Seconds*> unchecked = meters.as_foreign<Seconds>();
    ASSERT_TRUE(unchecked.ok());
    EXPECT_EQ(static_cast<void*>(unchecked.value()), meters.payload().data());
}

#else

TEST(TypeCheckModeTests, StrictDowncastRejectsOtherTypes) {
    Meters m{2.0};
    xjb::WidePtr ptr = xjb::WidePtr::make(&m);
    EXPECT_EQ(ptr.downcast<Seconds>(), nullptr);

    xjb::Value meters = xjb::Value::make_foreign<Meters>(xjb::heap_allocator(), Meters{4.0});
    xjb::Result<Seconds*> checked = meters.as_foreign<Seconds>();
    ASSERT_FALSE(checked.ok());
    EXPECT_EQ(checked.error().kind(), xjb::ErrorKind::TypeMismatch);

    EXPECT_FALSE(xjb::Value::from_int(1).as_bool().ok());
}

#endif
