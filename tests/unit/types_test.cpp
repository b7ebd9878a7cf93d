#include "kir_test_env.hpp"

namespace kir::test {
namespace {

class TypesTest : public KirTest {};

TEST_F(TypesTest, StructurallyEqualTypesShareAnId) {
    const TypeId a = builtins.list_type(builtins.int_type());
    const size_t interned = types.size();
    const TypeId b = builtins.list_type(builtins.int_type());
    EXPECT_EQ(a, b);
    EXPECT_EQ(types.size(), interned);

    EXPECT_NE(a, builtins.list_type(builtins.long_type()));
    EXPECT_NE(a, types.with_nullability(a, true));
    EXPECT_EQ(types.with_nullability(types.with_nullability(a, true), false),
              a);
}

TEST_F(TypesTest, ProjectionsAreDistinct) {
    const IrClass* array = builtins.find_class("Array");
    ASSERT_NE(array, nullptr);
    const TypeId int_type = builtins.int_type();

    const TypeId plain = types.class_(array, {TypeArg::simple(int_type)});
    const TypeId out = types.class_(
        array, {TypeArg::projection(Variance::Out, int_type)});
    const TypeId star = types.class_(array, {TypeArg::star()});
    EXPECT_NE(plain, out);
    EXPECT_NE(out, star);
    EXPECT_EQ(star, types.class_(array, {TypeArg::star()}));
}

TEST_F(TypesTest, Rendering) {
    const TypeId int_type = builtins.int_type();
    const TypeId string_type = builtins.string_type();

    EXPECT_EQ(types.to_string(fn_type({int_type, string_type},
                                      builtins.unit_type())),
              "(Int, String) -> Unit");
    EXPECT_EQ(types.to_string(suspend_fn_type({}, int_type)),
              "suspend () -> Int");
    EXPECT_EQ(types.to_string(builtins.function_type(
                  FunctionClassKind::KFunction, {int_type}, int_type)),
              "KFunction1<Int, Int>");
    EXPECT_EQ(types.to_string(builtins.vararg_array_type(string_type)),
              "Array<out String>");
    EXPECT_EQ(types.to_string(builtins.vararg_array_type(int_type)),
              "IntArray");
    EXPECT_EQ(types.to_string(types.intersection({int_type, string_type})),
              "{Int & String}");
    EXPECT_EQ(types.to_string(types.with_nullability(string_type, true)),
              "String?");
    EXPECT_EQ(types.to_string(types.error()), "<error>");
}

TEST_F(TypesTest, RuntimeTypesDropReflection) {
    const TypeId int_type = builtins.int_type();
    const TypeId k = builtins.function_type(FunctionClassKind::KFunction,
                                            {int_type}, int_type);
    EXPECT_EQ(converter.to_runtime_type(k), fn_type({int_type}, int_type));

    const TypeId ks = builtins.function_type(
        FunctionClassKind::KSuspendFunction, {}, int_type);
    EXPECT_EQ(converter.to_runtime_type(ks), suspend_fn_type({}, int_type));

    const TypeId nested = builtins.list_type(k);
    EXPECT_EQ(converter.to_runtime_type(nested),
              builtins.list_type(fn_type({int_type}, int_type)));

    EXPECT_EQ(converter.to_runtime_type(int_type), int_type);
}

}  // namespace
}  // namespace kir::test
