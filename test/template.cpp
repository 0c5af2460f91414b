#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "project.hpp"
#include "template.hpp"

using namespace protodesc;

namespace {

const llvm::json::Object& object(const llvm::json::Value& v)
{
    const llvm::json::Object* o = v.getAsObject();
    EXPECT_NE(o, nullptr);
    static const llvm::json::Object kEmpty;
    return o ? *o : kEmpty;
}

const llvm::json::Array& array(const llvm::json::Object& o, llvm::StringRef key)
{
    const llvm::json::Array* a = o.getArray(key);
    EXPECT_NE(a, nullptr) << key.str();
    static const llvm::json::Array kEmpty;
    return a ? *a : kEmpty;
}

const llvm::json::Object& member(const llvm::json::Object& o, llvm::StringRef key)
{
    const llvm::json::Object* m = o.getObject(key);
    EXPECT_NE(m, nullptr) << key.str();
    static const llvm::json::Object kEmpty;
    return m ? *m : kEmpty;
}

std::string str(const llvm::json::Object& o, llvm::StringRef key)
{
    if (auto s = o.getString(key))
        return s->str();
    return "<missing " + key.str() + ">";
}

std::optional<bool> boolean(const llvm::json::Object& o, llvm::StringRef key)
{
    if (auto b = o.getBoolean(key))
        return *b;
    return std::nullopt;
}

std::optional<std::int64_t> integer(const llvm::json::Object& o, llvm::StringRef key)
{
    if (auto i = o.getInteger(key))
        return *i;
    return std::nullopt;
}

}  // namespace

class TemplateTest : public ::testing::Test
{
  protected:
    const Schema& resolve(const std::string& name)
    {
        EXPECT_TRUE(project.add_proto(name));
        const Schema* schema = project.resolve();
        EXPECT_NE(schema, nullptr);
        return *schema;
    }

    Project project{std::filesystem::path(PROTODESC_TEST_PROTO_DIR)};
};

TEST_F(TemplateTest, EnumShape)
{
    TemplateBuilder builder{resolve("person.proto")};
    llvm::json::Value file = builder.file("person.proto");
    const llvm::json::Object& f = object(file);

    EXPECT_EQ(array(f, "imports").size(), 1u);
    const llvm::json::Object& person = object(array(f, "messages")[0]);
    const llvm::json::Array& enums = array(person, "enums");
    ASSERT_EQ(enums.size(), 1u);

    llvm::json::Value expected = llvm::json::Object{
        {"name", "PhoneType"},
        {"values",
         llvm::json::Array{
             llvm::json::Object{{"name", "MOBILE"}, {"titleName", "Mobile"}, {"number", 0}},
             llvm::json::Object{{"name", "HOME"}, {"titleName", "Home"}, {"number", 1}},
             llvm::json::Object{{"name", "WORK"}, {"titleName", "Work"}, {"number", 2}},
             llvm::json::Object{{"name", "WORK_FAX"}, {"titleName", "WorkFax"}, {"number", 3}},
         }},
        {"isEnum", true},
        {"fullName", "contacts.Person.PhoneType"}};
    EXPECT_EQ(enums[0], expected) << to_json(enums[0]);
}

TEST_F(TemplateTest, FieldShape)
{
    TemplateBuilder builder{resolve("person.proto")};
    const Message* person = project.proto("person.proto")->find_message("Person");

    llvm::json::Value custom = builder.field(*person->find_field("custom_fields"));
    const llvm::json::Object& c = object(custom);
    EXPECT_EQ(str(c, "name"), "custom_fields");
    EXPECT_EQ(str(c, "camelName"), "customFields");
    EXPECT_EQ(str(c, "titleName"), "CustomFields");
    EXPECT_EQ(str(c, "upperUnderscoreName"), "CUSTOM_FIELDS");
    EXPECT_EQ(str(c, "type"), "StringPair");
    EXPECT_EQ(integer(c, "number"), 5);
    EXPECT_EQ(boolean(c, "isRepeated"), true);
    EXPECT_EQ(boolean(c, "isNative"), false);
    EXPECT_EQ(str(member(c, "typeDescriptor"), "name"), "StringPair");
    EXPECT_EQ(array(member(c, "typeDescriptor"), "fields").size(), 2u);

    llvm::json::Value name = builder.field(*person->find_field("name"));
    const llvm::json::Object& n = object(name);
    EXPECT_EQ(boolean(n, "isNative"), true);
    EXPECT_EQ(boolean(n, "isRequired"), true);
    EXPECT_EQ(n.get("typeDescriptor"), nullptr);

    const Message* number = person->find_message("PhoneNumber");
    llvm::json::Value type = builder.field(*number->find_field("type"));
    const llvm::json::Object& t = object(type);
    EXPECT_EQ(str(t, "defaultValue"), "HOME");
    EXPECT_EQ(boolean(member(t, "typeDescriptor"), "isEnum"), true);
}

TEST_F(TemplateTest, NestedTypesAreQualified)
{
    TemplateBuilder builder{resolve("inner.proto")};
    const Message* tortilla = project.proto("inner.proto")->find_message("Tortilla");
    llvm::json::Value value = builder.message(*tortilla);
    const llvm::json::Array& fields = array(object(value), "fields");
    ASSERT_EQ(fields.size(), 4u);

    const char* expected[] = {"burrito.Tortilla.Filling", "burrito.Tortilla.Filling",
                              "burrito.Tortilla.Guac", "burrito.Tortilla.Guac"};
    for (size_t i = 0; i < fields.size(); i++)
        EXPECT_EQ(str(member(object(fields[i]), "typeDescriptor"), "fullName"), expected[i]);
}

TEST_F(TemplateTest, ServiceShape)
{
    TemplateBuilder builder{resolve("services.proto")};
    llvm::json::Value file = builder.file("services.proto");
    const llvm::json::Object& running = object(array(object(file), "services")[0]);
    EXPECT_EQ(str(running, "fullName"), "shoes.RunningShoe");
    EXPECT_EQ(boolean(member(running, "options"), "deprecated"), false);

    const llvm::json::Array& methods = array(running, "methods");
    ASSERT_EQ(methods.size(), 2u);
    const llvm::json::Object& lace = object(methods[0]);
    EXPECT_EQ(str(lace, "name"), "LaceShoe");
    EXPECT_EQ(str(lace, "camelName"), "laceShoe");
    EXPECT_EQ(str(lace, "upperUnderscoreName"), "LACE_SHOE");
    EXPECT_EQ(boolean(lace, "clientStreaming"), false);

    const llvm::json::Object& input = member(lace, "inputTypeDescriptor");
    const llvm::json::Object& output = member(lace, "outputTypeDescriptor");
    EXPECT_EQ(str(input, "fullName"), "shoes.Shoe");
    EXPECT_EQ(str(output, "fullName"), "shoes.FullShoe");
    EXPECT_EQ(str(object(array(input, "fields")[0]), "camelName"), "shoeId");
    EXPECT_EQ(str(object(array(output, "fields")[0]), "camelName"), "shoeId");
    EXPECT_EQ(str(object(array(output, "fields")[1]), "camelName"), "isLaced");
    EXPECT_EQ(str(object(array(output, "fields")[2]), "camelName"), "strideCount");

    const llvm::json::Object& track = object(methods[1]);
    EXPECT_EQ(boolean(track, "clientStreaming"), true);
    EXPECT_EQ(boolean(track, "serverStreaming"), true);
    EXPECT_EQ(boolean(member(track, "options"), "deprecated"), true);
}

TEST_F(TemplateTest, CyclesTerminate)
{
    TemplateBuilder builder{resolve("loop.proto")};
    const ProtoFile* loop = project.proto("loop.proto");
    const Message* dee = loop->find_message("TweedleDee");

    llvm::json::Value dum = builder.field(*dee->find_field("dum"));
    const llvm::json::Object& dum_type = member(object(dum), "typeDescriptor");
    EXPECT_EQ(str(dum_type, "name"), "TweedleDum");
    EXPECT_EQ(array(dum_type, "fields").size(), 1u);

    // Dum -> Dee -> Dum: the second Dum is a stub.
    const llvm::json::Object& dee_type =
        member(object(array(dum_type, "fields")[0]), "typeDescriptor");
    EXPECT_EQ(str(dee_type, "name"), "TweedleDee");
    const llvm::json::Object& stub =
        member(object(array(dee_type, "fields")[0]), "typeDescriptor");
    EXPECT_EQ(str(stub, "fullName"), "wonderland.TweedleDum");
    EXPECT_EQ(boolean(stub, "isRecursive"), true);
    EXPECT_EQ(stub.get("fields"), nullptr);

    llvm::json::Value node = builder.message(*loop->find_message("Node"));
    const llvm::json::Object& children =
        member(object(array(object(node), "fields")[1]), "typeDescriptor");
    EXPECT_EQ(boolean(children, "isRecursive"), true);

    llvm::json::Value whole = builder.file(*loop);
    EXPECT_FALSE(to_json(whole).empty());
}

TEST_F(TemplateTest, FileShape)
{
    TemplateBuilder builder{resolve("vehicle.proto")};
    llvm::json::Value file = builder.file("vehicle.proto");
    const llvm::json::Object& f = object(file);
    EXPECT_EQ(str(f, "name"), "vehicle.proto");
    EXPECT_EQ(str(f, "package"), "contacts.vehicles");
    EXPECT_EQ(str(f, "syntax"), "proto2");
    EXPECT_EQ(str(member(f, "options"), "java_outer_classname"), "VehicleProtos");
    EXPECT_TRUE(llvm::StringRef(str(f, "filePath")).endswith("vehicle.proto"));

    const llvm::json::Object& vehicle = object(array(f, "messages")[0]);
    EXPECT_EQ(str(vehicle, "fullName"), "contacts.vehicles.Vehicle");
    EXPECT_EQ(boolean(vehicle, "isMessage"), true);
    const llvm::json::Object& wheels = object(array(vehicle, "fields")[1]);
    EXPECT_EQ(integer(wheels, "defaultValue"), 4);

    EXPECT_EQ(builder.file("missing.proto"), llvm::json::Value(nullptr));
}

TEST_F(TemplateTest, MergedAndSyntheticFieldsAppear)
{
    ASSERT_TRUE(project.add_proto("extend.proto"));
    Message* base = project.proto("extend.proto")->find_message("Base");
    ASSERT_NE(project.add_synthetic_field(*base, ScalarType::String, "tag", 7), nullptr);
    const Schema* schema = project.resolve();
    ASSERT_NE(schema, nullptr);

    TemplateBuilder builder{*schema};
    llvm::json::Value value = builder.message(*base);
    const llvm::json::Object& b = object(value);
    const llvm::json::Array& fields = array(b, "fields");
    ASSERT_EQ(fields.size(), 5u);
    EXPECT_EQ(str(object(fields[1]), "name"), "tag");
    EXPECT_EQ(boolean(object(fields[1]), "isSynthetic"), true);
    EXPECT_EQ(str(object(fields[4]), "name"), "holder");
    EXPECT_EQ(str(member(object(fields[4]), "typeDescriptor"), "fullName"), "ext.Holder");

    const llvm::json::Array& ranges = array(b, "extensionRanges");
    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(integer(object(ranges[0]), "start"), 100);
}

TEST_F(TemplateTest, AllFiles)
{
    const Schema& schema = resolve("common.proto");
    TemplateBuilder builder{schema};
    llvm::json::Value all = builder.files();
    const llvm::json::Array* files = all.getAsArray();
    ASSERT_NE(files, nullptr);
    ASSERT_EQ(files->size(), 2u);
    EXPECT_EQ(str(object((*files)[1]), "name"), "person.proto");

    const llvm::json::Object& import = object(array(object((*files)[0]), "imports")[0]);
    EXPECT_EQ(str(import, "package"), "contacts");
    EXPECT_EQ(boolean(import, "isPublic"), false);
}

TEST_F(TemplateTest, DenseCyclesStayBounded)
{
    const Schema& schema = resolve("mesh.proto");
    TemplateBuilder builder{schema};
    std::string json = to_json(builder.files(), false);
    EXPECT_LT(json.size(), 4u * 1024 * 1024);

    // Node0 -> Node1 -> Node2 are inlined; Node2's references stop there.
    const Message* node0 = project.proto("mesh.proto")->find_message("Node0");
    llvm::json::Value value = builder.message(*node0);
    const llvm::json::Object& node1 =
        member(object(array(object(value), "fields")[0]), "typeDescriptor");
    EXPECT_EQ(str(node1, "fullName"), "mesh.Node1");
    EXPECT_EQ(boolean(object(array(node1, "fields")[0]), "isNative"), false);
    EXPECT_EQ(boolean(member(object(array(node1, "fields")[0]), "typeDescriptor"), "isRecursive"),
              true);

    const llvm::json::Object& node2 =
        member(object(array(node1, "fields")[1]), "typeDescriptor");
    EXPECT_EQ(str(node2, "fullName"), "mesh.Node2");
    ASSERT_EQ(array(node2, "fields").size(), 7u);

    const llvm::json::Object& node3 =
        member(object(array(node2, "fields")[2]), "typeDescriptor");
    EXPECT_EQ(str(node3, "fullName"), "mesh.Node3");
    EXPECT_EQ(str(node3, "package"), "mesh");
    EXPECT_EQ(boolean(node3, "isMessage"), true);
    EXPECT_EQ(node3.get("fields"), nullptr);
    EXPECT_EQ(node3.get("isRecursive"), nullptr);
}

TEST_F(TemplateTest, InlineDepthIsConfigurable)
{
    const Schema& schema = resolve("mesh.proto");
    TemplateBuilder shallow{schema, 0};
    const Message* node0 = project.proto("mesh.proto")->find_message("Node0");
    llvm::json::Value value = shallow.message(*node0);
    for (const llvm::json::Value& f : array(object(value), "fields"))
    {
        const llvm::json::Object& type = member(object(f), "typeDescriptor");
        EXPECT_EQ(boolean(type, "isMessage"), true);
        EXPECT_EQ(type.get("fields"), nullptr);
    }

    TemplateBuilder deep{schema, 3};
    llvm::json::Value deep_value = deep.message(*node0);
    const llvm::json::Object& node1 =
        member(object(array(object(deep_value), "fields")[0]), "typeDescriptor");
    const llvm::json::Object& node2 = member(object(array(node1, "fields")[1]), "typeDescriptor");
    const llvm::json::Object& node3 = member(object(array(node2, "fields")[2]), "typeDescriptor");
    EXPECT_EQ(str(node3, "fullName"), "mesh.Node3");
    EXPECT_EQ(array(node3, "fields").size(), 7u);
}

TEST(TemplateOptions, RepeatedNamesBecomeArrays)
{
    auto int_option = [](std::string name, std::int64_t v) {
        Option o{};
        o.name = std::move(name);
        o.value.kind = OptionValueKind::Int;
        o.value.int_value = v;
        o.value.text = std::to_string(v);
        return o;
    };
    OptionList options{int_option("(tag)", 1), int_option("deprecated", 0),
                       int_option("(tag)", 2), int_option("(tag)", 3)};
    llvm::json::Value value = options_object(options);
    const llvm::json::Object& o = object(value);

    EXPECT_EQ(integer(o, "deprecated"), 0);
    llvm::json::Value expected = llvm::json::Array{1, 2, 3};
    ASSERT_NE(o.get("(tag)"), nullptr);
    EXPECT_EQ(*o.get("(tag)"), expected) << to_json(value);
}
