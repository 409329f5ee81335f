#include "registry_fixture.hpp"

#include "record_layout.hpp"

#include <cstdint>
#include <limits>

using namespace keyreg;

namespace {
  class gadget {
  public:
    gadget(std::string label, float weight, bool active, unsigned count)
      : label_{std::move(label)}
      , weight_{weight}
      , active_{active}
      , count_{count}
    { }

    std::string const&
    label() const { return label_; }

    float
    weight() const { return weight_; }

    bool
    active() const { return active_; }

    unsigned
    count() const { return count_; }

  private:
    std::string label_;
    float       weight_;
    bool        active_;
    unsigned    count_;
  };

  record_layout<gadget>
  gadget_layout() {
    return define_record<gadget>("gadget")
      .field<&gadget::label>("label")
      .field<&gadget::weight>("weight")
      .field<&gadget::active>("active")
      .field<&gadget::count>("count")
      ;
  }
}

TEST(record_layout, attributes_in_declaration_order) {
  record_layout<person> layout = person_layout();
  ASSERT_EQ(layout.attributes().size(), 3u);
  EXPECT_EQ(layout.attributes()[0].name, "name");
  EXPECT_EQ(layout.attributes()[1].name, "id");
  EXPECT_EQ(layout.attributes()[2].name, "age");
  EXPECT_EQ(layout.type_name(), "person");
}

TEST(record_layout, accessor_for_member) {
  record_layout<person> layout = person_layout();
  person p{"Alice", identifier{0, 1}, 30};
  EXPECT_EQ(layout.attributes()[0].get(p), attribute_value{std::string{"Alice"}});
  EXPECT_EQ(layout.attributes()[1].get(p), attribute_value{identifier(0, 1)});
  EXPECT_EQ(layout.attributes()[2].get(p), attribute_value{std::int64_t{30}});
}

TEST(record_layout, accessor_for_getter) {
  record_layout<gadget> layout = gadget_layout();
  gadget g{"lamp", 1.5f, true, 4};
  EXPECT_EQ(layout.attributes()[0].get(g), attribute_value{std::string{"lamp"}});
  EXPECT_EQ(layout.attributes()[1].get(g), attribute_value{1.5});
  EXPECT_EQ(layout.attributes()[2].get(g), attribute_value{true});
  EXPECT_EQ(layout.attributes()[3].get(g), attribute_value{std::int64_t{4}});
}

TEST(record_layout, attribute_types_follow_member_types) {
  record_layout<gadget> layout = gadget_layout();
  EXPECT_EQ(layout.attributes()[0].type, key_type::string);
  EXPECT_EQ(layout.attributes()[1].type, key_type::real);
  EXPECT_EQ(layout.attributes()[2].type, key_type::boolean);
  EXPECT_EQ(layout.attributes()[3].type, key_type::integer);
  EXPECT_EQ(person_layout().attributes()[1].type, key_type::identifier);
}

TEST(record_layout, projections_are_plural_attribute_names) {
  record_layout<gadget> layout = gadget_layout();
  EXPECT_EQ(layout.projection_names(),
            (std::vector<std::string>{"labels", "weights", "actives",
                                      "counts"}));
  ASSERT_NE(layout.find_projection("labels"), nullptr);
  EXPECT_EQ(layout.find_projection("labels")->name, "label");
  EXPECT_EQ(layout.find_projection("label"), nullptr);
}

TEST(record_layout, attribute_declared_twice_is_rejected) {
  EXPECT_THROW(define_record<person>("person")
                 .field<&person::name>("name")
                 .field<&person::name>("name"),
               schema_error);
}

TEST(record_layout, invalid_attribute_name_is_rejected) {
  EXPECT_THROW(define_record<person>("person").field<&person::name>("1st"),
               schema_error);
}

TEST(record_layout, attributes_with_same_plural_are_rejected) {
  EXPECT_THROW(define_record<person>("person")
                 .field<&person::name>("bus")
                 .field<&person::age>("bu"),
               schema_error);
}

TEST(record_layout, describe_lists_attributes) {
  EXPECT_EQ(person_layout().describe(person{"Alice", identifier{0, 1}, 30}),
            "person{name: Alice, id: 00000000-0000-0000-0000-000000000001, "
            "age: 30}");
}

namespace {
  struct counter {
    std::string   name;
    std::uint64_t total;
  };
}

TEST(record_layout, unsigned_value_beyond_integer_range_is_rejected) {
  record_layout<counter> layout = define_record<counter>("counter")
    .field<&counter::name>("name")
    .field<&counter::total>("total");
  EXPECT_EQ(layout.attributes()[1].type, key_type::integer);

  counter small{"x", 42};
  EXPECT_EQ(layout.attributes()[1].get(small),
            attribute_value{std::int64_t{42}});

  counter limit{"y", std::numeric_limits<std::int64_t>::max()};
  EXPECT_EQ(layout.attributes()[1].get(limit),
            attribute_value{std::numeric_limits<std::int64_t>::max()});

  counter big{"z", std::numeric_limits<std::uint64_t>::max()};
  EXPECT_THROW(layout.attributes()[1].get(big), type_error);
  EXPECT_THROW(layout.describe(big), type_error);
}
