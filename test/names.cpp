#include <gtest/gtest.h>

#include "names.hpp"

using namespace protodesc;

TEST(Names, JoinScope)
{
    EXPECT_EQ(join_scope("", "Person"), "Person");
    EXPECT_EQ(join_scope("contacts", "Person"), "contacts.Person");
    EXPECT_EQ(join_scope("a.b", "C.D"), "a.b.C.D");
}

TEST(Names, ParentScope)
{
    EXPECT_EQ(parent_scope("a.b.c"), "a.b");
    EXPECT_EQ(parent_scope("a"), "");
    EXPECT_EQ(parent_scope(""), "");
}

TEST(Names, CamelCase)
{
    EXPECT_EQ(camel_case("LaceShoe"), "laceShoe");
    EXPECT_EQ(camel_case("shoe_id"), "shoeId");
    EXPECT_EQ(camel_case("is_laced"), "isLaced");
    EXPECT_EQ(camel_case("stride_count"), "strideCount");
    EXPECT_EQ(camel_case("id"), "id");
}

TEST(Names, PascalCase)
{
    EXPECT_EQ(pascal_case("shoe_id"), "ShoeId");
    EXPECT_EQ(pascal_case("custom_fields"), "CustomFields");
    EXPECT_EQ(pascal_case("LaceShoe"), "LaceShoe");
}

TEST(Names, ConstantTitleCase)
{
    EXPECT_EQ(constant_title_case("MOBILE"), "Mobile");
    EXPECT_EQ(constant_title_case("WORK_FAX"), "WorkFax");
    EXPECT_EQ(constant_title_case("A_B_C"), "ABC");
}

TEST(Names, UpperSnakeCase)
{
    EXPECT_EQ(upper_snake_case("LaceShoe"), "LACE_SHOE");
    EXPECT_EQ(upper_snake_case("shoeId"), "SHOE_ID");
    EXPECT_EQ(upper_snake_case("shoe_id"), "SHOE_ID");
    EXPECT_EQ(upper_snake_case("HTTPServer"), "HTTP_SERVER");
    EXPECT_EQ(upper_snake_case("Get2Things"), "GET2_THINGS");
}
