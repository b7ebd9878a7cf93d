#include "kir_test_env.hpp"

namespace kir::test {
namespace {

class FnTypesTest : public KirTest {};

TEST_F(FnTypesTest, ClassifiesFunctionalFamilies) {
    const TypeId int_type = builtins.int_type();
    const TypeId plain = fn_type({int_type}, int_type);
    const TypeId suspend = suspend_fn_type({int_type}, int_type);
    const TypeId k = builtins.function_type(FunctionClassKind::KFunction,
                                            {int_type}, int_type);
    const TypeId ks = builtins.function_type(
        FunctionClassKind::KSuspendFunction, {int_type}, int_type);

    EXPECT_FALSE(fn_types.is_suspend_functional_type(plain));
    EXPECT_TRUE(fn_types.is_suspend_functional_type(suspend));
    EXPECT_FALSE(fn_types.is_suspend_functional_type(k));
    EXPECT_TRUE(fn_types.is_suspend_functional_type(ks));

    for (TypeId t : {plain, suspend, k, ks}) {
        EXPECT_TRUE(fn_types.is_builtin_functional_type(t));
        EXPECT_EQ(fn_types.functional_arity(t), 1u);
    }
    EXPECT_FALSE(fn_types.is_builtin_functional_type(int_type));
    EXPECT_FALSE(fn_types.functional_arity(int_type).has_value());
}

TEST_F(FnTypesTest, NonSuspendSupertypeKeepsArguments) {
    const TypeId int_type = builtins.int_type();
    EXPECT_EQ(fn_types.to_non_suspend_functional_supertype(
                  suspend_fn_type({int_type}, builtins.string_type())),
              fn_type({int_type}, builtins.string_type()));
    EXPECT_FALSE(fn_types
                     .to_non_suspend_functional_supertype(
                         fn_type({}, builtins.unit_type()))
                     .has_value());
}

TEST_F(FnTypesTest, ReflectiveFunctionsAreFunctions) {
    const TypeId int_type = builtins.int_type();
    const TypeId k = builtins.function_type(FunctionClassKind::KFunction,
                                            {int_type}, int_type);
    const TypeId plain = fn_type({int_type}, int_type);
    EXPECT_TRUE(fn_types.is_subtype_of_functional_type(k, plain));
    EXPECT_FALSE(fn_types.is_subtype_of_functional_type(plain, k));
    EXPECT_FALSE(fn_types.is_subtype_of_functional_type(
        fn_type({}, int_type), plain));

    IrFunction* invoke = fn_types.find_invoke_member(k, plain);
    ASSERT_NE(invoke, nullptr);
    EXPECT_EQ(invoke, fn_types.find_base_invoke(k));
    EXPECT_EQ(invoke->value_params.size(), 1u);
}

TEST_F(FnTypesTest, BuiltinInvokeShape) {
    IrFunction* invoke = fn_types.find_base_invoke(
        suspend_fn_type({builtins.int_type()}, builtins.unit_type()));
    ASSERT_NE(invoke, nullptr);
    EXPECT_EQ(invoke->name, "invoke");
    EXPECT_TRUE(invoke->flags.is_suspend);
    EXPECT_TRUE(invoke->flags.is_operator);
    EXPECT_EQ(invoke->modality, Modality::Abstract);
    ASSERT_NE(invoke->dispatch_receiver, nullptr);
    EXPECT_EQ(fn_types.find_base_invoke(builtins.int_type()), nullptr);
}

TEST_F(FnTypesTest, InheritedInvokeIsFound) {
    const TypeId int_type = builtins.int_type();
    const TypeId unit_type = builtins.unit_type();
    const TypeId expected = fn_type({int_type}, unit_type);

    // open class Base : (Int) -> Unit { operator fun invoke(x: Int) }
    // class Derived : Base()
    IrClass* base = declare_class("Base");
    base->supertypes.push_back(expected);
    IrFunction* invoke = declare_fn("invoke", unit_type,
                                    FunctionFlags{.is_operator = true},
                                    IrFunctionKind::Simple, base);
    add_param(invoke, "x", int_type);
    base->functions.push_back(invoke);

    IrClass* derived = declare_class("Derived");
    derived->supertypes.push_back(types.simple_class(base, {}));
    const TypeId derived_type = types.simple_class(derived, {});

    EXPECT_TRUE(fn_types.is_subtype_of_functional_type(derived_type, expected));
    EXPECT_EQ(fn_types.find_contributed_invoke(derived_type, expected), invoke);
    EXPECT_EQ(fn_types.find_invoke_member(derived_type, expected), invoke);

    // Wrong arity.
    EXPECT_EQ(fn_types.find_contributed_invoke(derived_type,
                                               fn_type({}, unit_type)),
              nullptr);
}

TEST_F(FnTypesTest, NonClassArgumentsHaveNoInvoke) {
    const TypeId plain = fn_type({}, builtins.unit_type());
    EXPECT_EQ(fn_types.find_invoke_member(
                  types.intersection({plain, builtins.string_type()}), plain),
              nullptr);
    EXPECT_EQ(fn_types.find_invoke_member(builtins.string_type(), plain),
              nullptr);
}

}  // namespace
}  // namespace kir::test
