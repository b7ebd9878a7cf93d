#include "ir.hpp"

#include <llvm/Support/raw_ostream.h>

#include <string>

namespace kir {

IrFunction* IrClass::find_function(std::string_view fn_name) const {
    for (IrFunction* f : functions) {
        if (f && f->name == fn_name) return f;
    }
    return nullptr;
}

const char* ir_node_kind_name(IrNodeKind k) {
    switch (k) {
        case IrNodeKind::Class:
            return "class";
        case IrNodeKind::TypeParameter:
            return "type_param";
        case IrNodeKind::Function:
            return "fn";
        case IrNodeKind::ValueParameter:
            return "param";
        case IrNodeKind::Variable:
            return "var";
        case IrNodeKind::GetValue:
            return "get";
        case IrNodeKind::Const:
            return "const";
        case IrNodeKind::Call:
            return "call";
        case IrNodeKind::ConstructorCall:
            return "new";
        case IrNodeKind::FunctionReference:
            return "ref";
        case IrNodeKind::Vararg:
            return "vararg";
        case IrNodeKind::SpreadElement:
            return "spread";
        case IrNodeKind::Return:
            return "return";
        case IrNodeKind::Block:
            return "block";
        case IrNodeKind::FunctionExpression:
            return "fn_expr";
    }
    return "node";
}

const char* decl_origin_name(DeclOrigin o) {
    switch (o) {
        case DeclOrigin::Defined:
            return "defined";
        case DeclOrigin::Builtin:
            return "builtin";
        case DeclOrigin::AdapterForCallableReference:
            return "adapter_for_callable_reference";
        case DeclOrigin::AdapterParameterForCallableReference:
            return "adapter_parameter_for_callable_reference";
        case DeclOrigin::AdapterForSuspendConversion:
            return "adapter_for_suspend_conversion";
        case DeclOrigin::AdapterParameterForSuspendConversion:
            return "adapter_parameter_for_suspend_conversion";
    }
    return "defined";
}

const char* stmt_origin_name(StmtOrigin o) {
    switch (o) {
        case StmtOrigin::None:
            return "none";
        case StmtOrigin::AdaptedFunctionReference:
            return "adapted_function_reference";
        case StmtOrigin::SuspendConversion:
            return "suspend_conversion";
    }
    return "none";
}

namespace {

class IrPrinter {
   public:
    IrPrinter(llvm::raw_ostream& os, const TypeStore& types)
        : os_(os), types_(types) {}

    void print(const IrNode* node, unsigned depth) {
        if (!node) {
            line(depth) << "<no argument>\n";
            return;
        }
        switch (node->kind) {
            case IrNodeKind::Class: {
                auto* c = static_cast<const IrClass*>(node);
                line(depth) << "class " << c->name << "\n";
                for (const IrFunction* f : c->functions) print(f, depth + 1);
                break;
            }
            case IrNodeKind::TypeParameter: {
                auto* p = static_cast<const IrTypeParameter*>(node);
                line(depth) << "type_param " << p->name << "\n";
                break;
            }
            case IrNodeKind::Function:
                print_function(static_cast<const IrFunction*>(node), depth);
                break;
            case IrNodeKind::ValueParameter:
                print_param(static_cast<const IrValueParameter*>(node), depth,
                            "param");
                break;
            case IrNodeKind::Variable: {
                auto* v = static_cast<const IrVariable*>(node);
                line(depth) << "var " << v->name << ": "
                            << types_.to_string(v->type) << "\n";
                break;
            }
            case IrNodeKind::GetValue: {
                auto* g = static_cast<const IrGetValue*>(node);
                line(depth) << "get " << value_name(g->value) << ": "
                            << types_.to_string(g->type) << "\n";
                break;
            }
            case IrNodeKind::Const: {
                auto* c = static_cast<const IrConst*>(node);
                line(depth) << "const " << c->text << ": "
                            << types_.to_string(c->type) << "\n";
                break;
            }
            case IrNodeKind::Call:
            case IrNodeKind::ConstructorCall:
            case IrNodeKind::FunctionReference:
                print_access(static_cast<const IrMemberAccess*>(node), depth);
                break;
            case IrNodeKind::Vararg: {
                auto* v = static_cast<const IrVararg*>(node);
                line(depth) << "vararg: " << types_.to_string(v->type)
                            << " elem=" << types_.to_string(v->element_type)
                            << "\n";
                for (const IrNode* e : v->elements) print(e, depth + 1);
                break;
            }
            case IrNodeKind::SpreadElement: {
                auto* s = static_cast<const IrSpreadElement*>(node);
                line(depth) << "spread\n";
                print(s->expr, depth + 1);
                break;
            }
            case IrNodeKind::Return: {
                auto* r = static_cast<const IrReturn*>(node);
                line(depth) << "return from "
                            << (r->target ? r->target->name : "<fn>") << "\n";
                print(r->value, depth + 1);
                break;
            }
            case IrNodeKind::Block: {
                auto* b = static_cast<const IrBlock*>(node);
                line(depth) << "block: " << types_.to_string(b->type);
                if (b->origin != StmtOrigin::None)
                    os_ << " origin=" << stmt_origin_name(b->origin);
                os_ << "\n";
                for (const IrNode* s : b->statements) print(s, depth + 1);
                break;
            }
            case IrNodeKind::FunctionExpression: {
                auto* f = static_cast<const IrFunctionExpression*>(node);
                line(depth) << "fn_expr: " << types_.to_string(f->type);
                if (f->origin != StmtOrigin::None)
                    os_ << " origin=" << stmt_origin_name(f->origin);
                os_ << "\n";
                print(f->function, depth + 1);
                break;
            }
        }
    }

   private:
    llvm::raw_ostream& os_;
    const TypeStore& types_;

    llvm::raw_ostream& line(unsigned depth) {
        os_.indent(depth * 2);
        return os_;
    }

    static std::string value_name(const IrDeclaration* d) {
        if (!d) return "<value>";
        if (d->kind == IrNodeKind::ValueParameter)
            return static_cast<const IrValueParameter*>(d)->name;
        if (d->kind == IrNodeKind::Variable)
            return static_cast<const IrVariable*>(d)->name;
        return "<value>";
    }

    void print_param(const IrValueParameter* p, unsigned depth,
                     const char* label) {
        line(depth) << label << " " << p->name;
        if (p->index >= 0) os_ << "#" << p->index;
        os_ << ": ";
        if (p->vararg_element_type)
            os_ << "vararg " << types_.to_string(*p->vararg_element_type)
                << " (" << types_.to_string(p->type) << ")";
        else
            os_ << types_.to_string(p->type);
        if (p->has_default) os_ << " = <default>";
        os_ << "\n";
    }

    void print_function(const IrFunction* f, unsigned depth) {
        line(depth) << (f->fn_kind == IrFunctionKind::Constructor ? "ctor "
                                                                   : "fn ");
        if (f->flags.is_suspend) os_ << "suspend ";
        if (f->flags.is_inline) os_ << "inline ";
        if (f->flags.is_operator) os_ << "operator ";
        if (f->flags.is_infix) os_ << "infix ";
        if (f->flags.is_tailrec) os_ << "tailrec ";
        if (f->flags.is_external) os_ << "external ";
        if (f->flags.is_expect) os_ << "expect ";
        os_ << f->name << ": " << types_.to_string(f->return_type);
        if (f->origin != DeclOrigin::Defined)
            os_ << " origin=" << decl_origin_name(f->origin);
        os_ << "\n";
        if (f->dispatch_receiver)
            print_param(f->dispatch_receiver, depth + 1, "dispatch");
        if (f->extension_receiver)
            print_param(f->extension_receiver, depth + 1, "extension");
        for (const IrValueParameter* p : f->value_params)
            print_param(p, depth + 1, "param");
        if (!f->has_body) return;
        line(depth + 1) << "body\n";
        for (const IrNode* s : f->body) print(s, depth + 2);
    }

    void print_access(const IrMemberAccess* a, unsigned depth) {
        line(depth) << ir_node_kind_name(a->kind) << " "
                    << (a->callee ? a->callee->name : "<fn>") << ": "
                    << types_.to_string(a->type);
        if (!a->type_args.empty()) {
            os_ << " <";
            for (size_t i = 0; i < a->type_args.size(); i++) {
                if (i) os_ << ", ";
                os_ << types_.to_string(a->type_args[i]);
            }
            os_ << ">";
        }
        if (a->origin != StmtOrigin::None)
            os_ << " origin=" << stmt_origin_name(a->origin);
        os_ << "\n";
        if (a->dispatch_receiver) {
            line(depth + 1) << "$dispatch\n";
            print(a->dispatch_receiver, depth + 2);
        }
        if (a->extension_receiver) {
            line(depth + 1) << "$extension\n";
            print(a->extension_receiver, depth + 2);
        }
        // References carry no arguments; keep their dump short.
        if (a->kind == IrNodeKind::FunctionReference) return;
        for (size_t i = 0; i < a->value_args.size(); i++) {
            line(depth + 1) << "arg#" << i << "\n";
            print(a->value_args[i], depth + 2);
        }
    }
};

}  // namespace

void dump_ir(llvm::raw_ostream& os, const TypeStore& types, const IrNode* node) {
    IrPrinter(os, types).print(node, 0);
}

std::string ir_to_string(const TypeStore& types, const IrNode* node) {
    std::string out{};
    llvm::raw_string_ostream os(out);
    dump_ir(os, types, node);
    os.flush();
    return out;
}

}  // namespace kir
