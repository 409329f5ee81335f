#include "registry_fixture.hpp"

using namespace keyreg;

struct projection : registry_fixture { };

TEST_F(projection, projects_attribute_in_record_order) {
  add_alice_and_bob();
  people.append(make_person("Carol", u3, 41));

  std::vector<attribute_value> names = people.project("names");
  ASSERT_EQ(names.size(), people.size());
  for (std::size_t i = 0; i < names.size(); ++i)
    EXPECT_EQ(expect<std::string>(names[i]), people.records()[i].name);
}

TEST_F(projection, projects_every_attribute) {
  add_alice_and_bob();
  EXPECT_EQ(people.project("ids"),
            (std::vector<attribute_value>{u1, u2}));
  EXPECT_EQ(people.project("ages"),
            (std::vector<attribute_value>{std::int64_t{30}, std::int64_t{25}}));
}

TEST_F(projection, empty_registry_projects_empty_list) {
  EXPECT_TRUE(people.project("names").empty());
}

TEST_F(projection, projection_follows_mutation) {
  add_alice_and_bob();
  people.erase("Alice");
  people.append(make_person("Carol", u3));
  people.replace("Bob", make_person("Robert", u2));

  EXPECT_EQ(people.project("names"),
            (std::vector<attribute_value>{std::string{"Robert"},
                                          std::string{"Carol"}}));
}

TEST_F(projection, unknown_name_throws) {
  try {
    people.project("nmes");
    FAIL() << "Expected attribute_not_found";
  } catch (attribute_not_found const& e) {
    EXPECT_EQ(e.name(), "nmes");
  }
}

TEST_F(projection, singular_attribute_name_is_not_a_projection) {
  EXPECT_THROW(people.project("name"), attribute_not_found);
  EXPECT_FALSE(people.has_projection("name"));
  EXPECT_TRUE(people.has_projection("names"));
}

TEST_F(projection, projection_names_in_attribute_order) {
  EXPECT_EQ(people.projection_names(),
            (std::vector<std::string>{"names", "ids", "ages"}));
}

TEST_F(projection, key_projection_name_is_not_a_column) {
  registry<person> r{person_layout(),
                     key_schema{{"people", "name", key_type::string}}};
  r.append(make_person("Alice", u1));

  EXPECT_EQ(r.get("Alice").id, u1);
  EXPECT_FALSE(r.has_projection("people"));
  EXPECT_THROW(r.project("people"), attribute_not_found);
}

TEST_F(projection, key_may_reuse_plural_of_other_attribute) {
  registry<person> r{person_layout(),
                     key_schema{{"ages", "name", key_type::string}}};
  r.append(make_person("Alice", u1, 30));

  EXPECT_EQ(r.get("Alice").age, 30);
  EXPECT_EQ(r.project("ages"),
            (std::vector<attribute_value>{std::int64_t{30}}));
}

namespace {
  struct edge {
    identifier from;
    identifier to;
  };
}

TEST_F(projection, identifier_keys_may_share_projection_name) {
  registry<edge> edges{
    define_record<edge>("edge")
      .field<&edge::from>("from")
      .field<&edge::to>("to"),
    key_schema{{"ids", "from", key_type::identifier},
               {"ids", "to", key_type::identifier}}
  };
  edges.append(edge{u1, u2});

  EXPECT_EQ(edges.get(u1).to, u2);
  EXPECT_EQ(edges.projection_names(), (std::vector<std::string>{"froms", "tos"}));
}

namespace {
  struct item {
    std::string category;
    int         box;
    bool        status;
  };
}

TEST_F(projection, projection_names_use_plural_rules) {
  registry<item> items{
    define_record<item>("item")
      .field<&item::category>("category")
      .field<&item::box>("box")
      .field<&item::status>("status"),
    key_schema{{"categories", "category", key_type::string}}
  };
  items.append(item{"tools", 3, true});
  items.append(item{"toys", 1, false});

  EXPECT_EQ(items.projection_names(),
            (std::vector<std::string>{"categories", "boxes", "status"}));
  EXPECT_EQ(items.project("boxes"),
            (std::vector<attribute_value>{std::int64_t{3}, std::int64_t{1}}));
  EXPECT_EQ(items.project("status"),
            (std::vector<attribute_value>{true, false}));
}
