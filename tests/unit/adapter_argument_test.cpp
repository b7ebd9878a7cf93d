// Suspend conversion of function-typed arguments.

#include "kir_test_env.hpp"

namespace kir::test {
namespace {

class AdapterArgumentTest : public KirTest {
   protected:
    static IrFunction* block_adapter(IrExpression* e) {
        if (!e || e->kind != IrNodeKind::Block) return nullptr;
        auto* block = static_cast<IrBlock*>(e);
        if (block->statements.size() != 2 ||
            block->statements[0]->kind != IrNodeKind::Function)
            return nullptr;
        return static_cast<IrFunction*>(block->statements[0]);
    }
};

TEST_F(AdapterArgumentTest, ConvertsPlainFunctionalValue) {
    const TypeId plain_type = fn_type({}, builtins.unit_type());
    const TypeId expected = suspend_fn_type({}, builtins.unit_type());
    IrGetValue* argument = local_value("plain", plain_type);

    IrExpression* result =
        synthesizer().synthesize_for_argument(argument, expected);
    ASSERT_NE(result, nullptr);
    ASSERT_EQ(result->kind, IrNodeKind::Block);
    auto* block = static_cast<IrBlock*>(result);
    EXPECT_EQ(block->origin, StmtOrigin::SuspendConversion);
    EXPECT_EQ(block->type, expected);

    IrFunction* adapter = block_adapter(result);
    ASSERT_NE(adapter, nullptr);
    EXPECT_EQ(adapter->name, "suspendConversion");
    EXPECT_EQ(adapter->origin, DeclOrigin::AdapterForSuspendConversion);
    EXPECT_EQ(adapter->visibility, Visibility::Local);
    EXPECT_EQ(adapter->parent, enclosing);
    EXPECT_TRUE(adapter->flags.is_suspend);
    EXPECT_FALSE(adapter->flags.is_inline);
    EXPECT_FALSE(adapter->flags.is_operator);
    ASSERT_NE(adapter->extension_receiver, nullptr);
    EXPECT_EQ(adapter->extension_receiver->name, "callee");
    EXPECT_EQ(adapter->extension_receiver->type, plain_type);
    EXPECT_EQ(adapter->extension_receiver->origin,
              DeclOrigin::AdapterParameterForSuspendConversion);

    ASSERT_EQ(adapter->body.size(), 1u);
    ASSERT_EQ(adapter->body[0]->kind, IrNodeKind::Call);
    auto* call = static_cast<IrCall*>(adapter->body[0]);
    EXPECT_EQ(call->callee, fn_types.find_base_invoke(plain_type));
    EXPECT_EQ(read_value(call->dispatch_receiver), adapter->extension_receiver);

    ASSERT_EQ(block->statements[1]->kind, IrNodeKind::FunctionReference);
    auto* reference = static_cast<IrFunctionReference*>(block->statements[1]);
    EXPECT_EQ(reference->callee, adapter);
    EXPECT_EQ(reference->extension_receiver, argument);
    EXPECT_EQ(reference->origin, StmtOrigin::SuspendConversion);
    EXPECT_EQ(reference->type, expected);

    EXPECT_TRUE(session.diags.empty());
    EXPECT_EQ(symbols.scope_depth(), 0u);
}

TEST_F(AdapterArgumentTest, ForwardsParametersAndReturnsResult) {
    const TypeId int_type = builtins.int_type();
    const TypeId string_type = builtins.string_type();
    IrGetValue* argument =
        local_value("format", fn_type({int_type, int_type}, string_type));
    const TypeId expected = suspend_fn_type({int_type, int_type}, string_type);

    IrFunction* adapter =
        block_adapter(synthesizer().synthesize_for_argument(argument, expected));
    ASSERT_NE(adapter, nullptr);
    ASSERT_EQ(adapter->value_params.size(), 2u);
    EXPECT_EQ(adapter->value_params[0]->name, "p0");
    EXPECT_EQ(adapter->value_params[1]->name, "p1");
    EXPECT_EQ(adapter->return_type, string_type);

    ASSERT_EQ(adapter->body.size(), 1u);
    ASSERT_EQ(adapter->body[0]->kind, IrNodeKind::Return);
    IrMemberAccess* call = forwarded_call(adapter);
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(read_value(call->value_argument(0)), adapter->value_params[0]);
    EXPECT_EQ(read_value(call->value_argument(1)), adapter->value_params[1]);
}

TEST_F(AdapterArgumentTest, ConvertedArgumentIsLeftAlone) {
    IrGetValue* argument =
        local_value("plain", fn_type({}, builtins.unit_type()));
    const TypeId expected = suspend_fn_type({}, builtins.unit_type());

    AdapterSynthesizer s = synthesizer();
    IrExpression* once = s.synthesize_for_argument(argument, expected);
    ASSERT_NE(once, nullptr);
    const size_t nodes = arena.size();
    EXPECT_EQ(s.synthesize_for_argument(once, expected), once);
    EXPECT_EQ(arena.size(), nodes);
}

TEST_F(AdapterArgumentTest, AdaptedReferenceIsLeftAlone) {
    IrBlock* adapted = factory.create_block(
        Span{}, fn_type({}, builtins.unit_type()),
        StmtOrigin::AdaptedFunctionReference);
    EXPECT_EQ(synthesizer().synthesize_for_argument(
                  adapted, suspend_fn_type({}, builtins.unit_type())),
              adapted);
}

TEST_F(AdapterArgumentTest, NothingToDo) {
    IrGetValue* plain = local_value("plain", fn_type({}, builtins.unit_type()));
    const TypeId suspend_type = suspend_fn_type({}, builtins.unit_type());

    EXPECT_EQ(synthesizer().synthesize_for_argument(plain, std::nullopt), plain);
    EXPECT_EQ(synthesizer().synthesize_for_argument(
                  plain, fn_type({}, builtins.unit_type())),
              plain);

    LanguageFeatures off{.suspend_conversion = false};
    EXPECT_EQ(synthesizer(off).synthesize_for_argument(plain, suspend_type),
              plain);

    IrGetValue* already = local_value("already", suspend_type);
    EXPECT_EQ(synthesizer().synthesize_for_argument(already, suspend_type),
              already);

    IrGetValue* text = local_value("text", builtins.string_type());
    EXPECT_EQ(synthesizer().synthesize_for_argument(text, suspend_type), text);

    EXPECT_TRUE(session.diags.empty());
}

TEST_F(AdapterArgumentTest, IntersectionTypedArgumentIsLeftAlone) {
    const TypeId plain_type = fn_type({}, builtins.unit_type());
    IrGetValue* both = local_value(
        "both", types.intersection({plain_type, builtins.string_type()}));
    const TypeId expected = suspend_fn_type({}, builtins.unit_type());
    EXPECT_EQ(synthesizer().synthesize_for_argument(both, expected), both);
}

TEST_F(AdapterArgumentTest, FunctionalSubclassUsesContributedInvoke) {
    const TypeId int_type = builtins.int_type();
    const TypeId unit_type = builtins.unit_type();

    // class Handler : (Int) -> Unit { override fun invoke(x: Int) }
    IrClass* handler = declare_class("Handler");
    handler->supertypes.push_back(fn_type({int_type}, unit_type));
    IrFunction* invoke = declare_fn("invoke", unit_type,
                                    FunctionFlags{.is_operator = true},
                                    IrFunctionKind::Simple, handler);
    invoke->dispatch_receiver =
        receiver_param(invoke, types.simple_class(handler, {}));
    add_param(invoke, "x", int_type);
    handler->functions.push_back(invoke);

    IrGetValue* argument =
        local_value("h", types.simple_class(handler, {}));
    IrFunction* adapter = block_adapter(synthesizer().synthesize_for_argument(
        argument, suspend_fn_type({int_type}, unit_type)));
    IrMemberAccess* call = forwarded_call(adapter);
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->callee, invoke);
    EXPECT_EQ(read_value(call->value_argument(0)), adapter->value_params[0]);
}

TEST_F(AdapterArgumentTest, ReflectiveExpectedTypeIsConverted) {
    const TypeId int_type = builtins.int_type();
    const TypeId unit_type = builtins.unit_type();
    const TypeId expected = builtins.function_type(
        FunctionClassKind::KSuspendFunction, {int_type}, unit_type);
    IrGetValue* argument = local_value("f", fn_type({int_type}, unit_type));

    IrExpression* result =
        synthesizer().synthesize_for_argument(argument, expected);
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result->type, suspend_fn_type({int_type}, unit_type));
}

}  // namespace
}  // namespace kir::test
