#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "span.hpp"
#include "types.hpp"

namespace llvm {
class raw_ostream;
}  // namespace llvm

namespace kir {

enum class IrNodeKind : std::uint8_t {
  // Declarations
  Class,
  TypeParameter,
  Function,
  ValueParameter,
  Variable,

  // Expressions
  GetValue,
  Const,
  Call,
  ConstructorCall,
  FunctionReference,
  Vararg,
  SpreadElement,
  Return,
  Block,
  FunctionExpression,
};

enum class DeclOrigin : std::uint8_t {
  Defined,
  Builtin,
  AdapterForCallableReference,
  AdapterParameterForCallableReference,
  AdapterForSuspendConversion,
  AdapterParameterForSuspendConversion,
};

enum class StmtOrigin : std::uint8_t {
  None,
  AdaptedFunctionReference,
  SuspendConversion,
};

enum class Visibility : std::uint8_t { Public, Private, Local };
enum class Modality : std::uint8_t { Final, Open, Abstract };

enum class FunctionClassKind : std::uint8_t {
  Function,
  SuspendFunction,
  KFunction,
  KSuspendFunction,
};

struct IrNode {
  IrNodeKind kind{};
  Span span{};

  IrNode(IrNodeKind kind, Span span) : kind(kind), span(span) {}
  virtual ~IrNode() = default;
};

class IrArena {
 public:
  template <typename T, typename... Args>
  T* make(Args&&... args) {
    auto node = std::make_unique<T>(std::forward<Args>(args)...);
    T* raw = node.get();
    nodes_.push_back(std::move(node));
    return raw;
  }

  size_t size() const { return nodes_.size(); }

 private:
  std::vector<std::unique_ptr<IrNode>> nodes_{};
};

// ---- Declarations ----

struct IrDeclaration : IrNode {
  DeclOrigin origin = DeclOrigin::Defined;
  IrDeclaration* parent = nullptr;

  IrDeclaration(IrNodeKind kind, Span span, DeclOrigin origin)
      : IrNode(kind, span), origin(origin) {}
};

struct IrTypeParameter final : IrDeclaration {
  std::string name{};
  std::uint32_t index = 0;
  Variance variance = Variance::Invariant;

  explicit IrTypeParameter(Span span, DeclOrigin origin, std::string name,
                           std::uint32_t index, Variance variance)
      : IrDeclaration(IrNodeKind::TypeParameter, span, origin),
        name(std::move(name)),
        index(index),
        variance(variance) {}
};

struct IrFunction;

struct FunctionalClassInfo {
  FunctionClassKind kind = FunctionClassKind::Function;
  std::uint32_t arity = 0;
};

struct IrClass final : IrDeclaration {
  std::string name{};
  std::vector<IrTypeParameter*> type_params{};
  std::vector<TypeId> supertypes{};
  std::vector<IrFunction*> functions{};

  // Set for the builtin `FunctionN`/`SuspendFunctionN`/`KFunctionN`/
  // `KSuspendFunctionN` families.
  std::optional<FunctionalClassInfo> functional{};

  explicit IrClass(Span span, DeclOrigin origin, std::string name)
      : IrDeclaration(IrNodeKind::Class, span, origin), name(std::move(name)) {}

  IrFunction* find_function(std::string_view fn_name) const;
};

struct IrValueParameter final : IrDeclaration {
  std::string name{};
  std::int32_t index = 0;  // -1 for receivers
  TypeId type = 0;
  std::optional<TypeId> vararg_element_type{};
  bool has_default = false;

  explicit IrValueParameter(Span span, DeclOrigin origin, std::string name,
                            std::int32_t index, TypeId type)
      : IrDeclaration(IrNodeKind::ValueParameter, span, origin),
        name(std::move(name)),
        index(index),
        type(type) {}

  bool is_vararg() const { return vararg_element_type.has_value(); }
};

struct IrVariable final : IrDeclaration {
  std::string name{};
  TypeId type = 0;

  explicit IrVariable(Span span, DeclOrigin origin, std::string name,
                      TypeId type)
      : IrDeclaration(IrNodeKind::Variable, span, origin),
        name(std::move(name)),
        type(type) {}
};

enum class IrFunctionKind : std::uint8_t {
  Simple,
  Constructor,
  PropertyAccessor,
};

struct FunctionFlags {
  bool is_inline = false;
  bool is_external = false;
  bool is_tailrec = false;
  bool is_suspend = false;
  bool is_operator = false;
  bool is_infix = false;
  bool is_expect = false;
};

using SymbolId = std::uint32_t;

struct IrFunction final : IrDeclaration {
  IrFunctionKind fn_kind = IrFunctionKind::Simple;
  SymbolId symbol = 0;  // 0 until declared in a SymbolTable
  std::string name{};
  Visibility visibility = Visibility::Public;
  Modality modality = Modality::Final;
  TypeId return_type = 0;
  FunctionFlags flags{};

  std::vector<IrTypeParameter*> type_params{};
  IrValueParameter* dispatch_receiver = nullptr;
  IrValueParameter* extension_receiver = nullptr;
  std::vector<IrValueParameter*> value_params{};

  bool has_body = false;
  std::vector<IrNode*> body{};

  explicit IrFunction(Span span, DeclOrigin origin, IrFunctionKind fn_kind,
                      std::string name, TypeId return_type)
      : IrDeclaration(IrNodeKind::Function, span, origin),
        fn_kind(fn_kind),
        name(std::move(name)),
        return_type(return_type) {}
};

// A function symbol as handed over by declaration storage. `owner` stays null
// while the symbol is unbound.
struct FunctionSymbol {
  IrFunction* owner = nullptr;

  bool is_bound() const { return owner != nullptr; }
};

// ---- Expressions ----

struct IrExpression : IrNode {
  TypeId type = 0;

  IrExpression(IrNodeKind kind, Span span, TypeId type)
      : IrNode(kind, span), type(type) {}
};

struct IrGetValue final : IrExpression {
  IrDeclaration* value = nullptr;  // IrValueParameter or IrVariable
  StmtOrigin origin = StmtOrigin::None;

  explicit IrGetValue(Span span, TypeId type, IrDeclaration* value,
                      StmtOrigin origin)
      : IrExpression(IrNodeKind::GetValue, span, type),
        value(value),
        origin(origin) {}
};

struct IrConst final : IrExpression {
  std::string text{};

  explicit IrConst(Span span, TypeId type, std::string text)
      : IrExpression(IrNodeKind::Const, span, type), text(std::move(text)) {}
};

// Common shape of calls and function references.
struct IrMemberAccess : IrExpression {
  IrFunction* callee = nullptr;
  IrExpression* dispatch_receiver = nullptr;
  IrExpression* extension_receiver = nullptr;

  // One slot per callee value parameter. A null slot means "no argument":
  // the callee's default value (or an empty vararg) applies.
  std::vector<IrExpression*> value_args{};
  std::vector<TypeId> type_args{};
  StmtOrigin origin = StmtOrigin::None;

  IrMemberAccess(IrNodeKind kind, Span span, TypeId type, IrFunction* callee,
                 size_t value_arg_count, StmtOrigin origin)
      : IrExpression(kind, span, type),
        callee(callee),
        value_args(value_arg_count, nullptr),
        origin(origin) {}

  void put_value_argument(size_t index, IrExpression* arg) {
    value_args.at(index) = arg;
  }
  IrExpression* value_argument(size_t index) const {
    return value_args.at(index);
  }
};

struct IrCall final : IrMemberAccess {
  explicit IrCall(Span span, TypeId type, IrFunction* callee,
                  size_t value_arg_count, StmtOrigin origin)
      : IrMemberAccess(IrNodeKind::Call, span, type, callee, value_arg_count,
                       origin) {}
};

struct IrConstructorCall final : IrMemberAccess {
  explicit IrConstructorCall(Span span, TypeId type, IrFunction* callee,
                             size_t value_arg_count, StmtOrigin origin)
      : IrMemberAccess(IrNodeKind::ConstructorCall, span, type, callee,
                       value_arg_count, origin) {}
};

struct IrFunctionReference final : IrMemberAccess {
  explicit IrFunctionReference(Span span, TypeId type, IrFunction* callee,
                               size_t value_arg_count, StmtOrigin origin)
      : IrMemberAccess(IrNodeKind::FunctionReference, span, type, callee,
                       value_arg_count, origin) {}
};

struct IrSpreadElement final : IrNode {
  IrExpression* expr = nullptr;

  explicit IrSpreadElement(Span span, IrExpression* expr)
      : IrNode(IrNodeKind::SpreadElement, span), expr(expr) {}
};

struct IrVararg final : IrExpression {
  TypeId element_type = 0;
  std::vector<IrNode*> elements{};  // IrExpression or IrSpreadElement

  explicit IrVararg(Span span, TypeId array_type, TypeId element_type)
      : IrExpression(IrNodeKind::Vararg, span, array_type),
        element_type(element_type) {}

  void add_element(IrNode* e) { elements.push_back(e); }
};

struct IrReturn final : IrExpression {
  IrFunction* target = nullptr;
  IrExpression* value = nullptr;

  explicit IrReturn(Span span, TypeId type, IrFunction* target,
                    IrExpression* value)
      : IrExpression(IrNodeKind::Return, span, type),
        target(target),
        value(value) {}
};

struct IrBlock final : IrExpression {
  StmtOrigin origin = StmtOrigin::None;
  std::vector<IrNode*> statements{};

  explicit IrBlock(Span span, TypeId type, StmtOrigin origin)
      : IrExpression(IrNodeKind::Block, span, type), origin(origin) {}
};

struct IrFunctionExpression final : IrExpression {
  IrFunction* function = nullptr;
  StmtOrigin origin = StmtOrigin::None;

  explicit IrFunctionExpression(Span span, TypeId type, IrFunction* function,
                                StmtOrigin origin)
      : IrExpression(IrNodeKind::FunctionExpression, span, type),
        function(function),
        origin(origin) {}
};

const char* ir_node_kind_name(IrNodeKind k);
const char* decl_origin_name(DeclOrigin o);
const char* stmt_origin_name(StmtOrigin o);

// Debug output.
void dump_ir(llvm::raw_ostream& os, const TypeStore& types, const IrNode* node);
std::string ir_to_string(const TypeStore& types, const IrNode* node);

}  // namespace kir
