#include "hh_outline/outline/outline_builder.hpp"

#include <utility>

#include "hh_outline/basic/casting.hpp"
#include "hh_outline/outline/modifiers.hpp"
#include "hh_outline/syntax/frontend.hpp"

namespace hh_outline
{
namespace
{

[[nodiscard]] DefKind def_kind_of(ClassKind kind) noexcept
{
  switch (kind) {
    case ClassKind::Interface:
      return DefKind::Interface;
    case ClassKind::Trait:
      return DefKind::Trait;
    case ClassKind::Enum:
      return DefKind::Enum;
    case ClassKind::Normal:
    case ClassKind::Abstract:
      return DefKind::Class;
  }
  return DefKind::Class;
}

Def make_def(
  const SourceFile & file, DefKind kind, std::string_view name, SourceRange pos, SourceRange span,
  std::vector<Modifier> modifiers = {})
{
  Def def;
  def.kind = kind;
  def.name = std::string(name);
  def.pos = file.to_absolute(pos);
  def.span = file.to_absolute(span);
  def.modifiers = std::move(modifiers);
  return def;
}

Def summarize_method(const SourceFile & file, const MethodDecl & method)
{
  std::vector<Modifier> mods = normalize_modifiers(method.modifiers);
  for (const Modifier m : fun_kind_modifiers(method.funKind)) {
    mods.push_back(m);
  }
  return make_def(
    file, DefKind::Method, method.name, method.nameRange, method.get_range(), std::move(mods));
}

}  // namespace

std::string_view strip_ns(std::string_view name) noexcept
{
  const size_t sep = name.rfind('\\');
  if (sep == std::string_view::npos) {
    return name;
  }
  return name.substr(sep + 1);
}

Def summarize_function(const SourceFile & file, const FunDecl & fn)
{
  return make_def(
    file, DefKind::Function, strip_ns(fn.name), fn.nameRange, fn.get_range(),
    fun_kind_modifiers(fn.funKind));
}

Def summarize_class(const SourceFile & file, const ClassDecl & cls)
{
  std::vector<Modifier> mods;
  if (cls.isFinal) {
    mods.push_back(Modifier::Final);
  }
  if (cls.classKind == ClassKind::Abstract) {
    mods.insert(mods.begin(), Modifier::Abstract);
  }

  Def def = make_def(
    file, def_kind_of(cls.classKind), strip_ns(cls.name), cls.nameRange, cls.get_range(),
    std::move(mods));

  for (const ClassMember * member : cls.members) {
    summarize_member(file, *member, def.children);
  }
  return def;
}

void summarize_member(const SourceFile & file, const ClassMember & member, std::vector<Def> & out)
{
  switch (member.get_kind()) {
    case NodeKind::MethodDecl:
      out.push_back(summarize_method(file, *cast<MethodDecl>(&member)));
      return;

    case NodeKind::ClassVarsDecl: {
      const auto * group = cast<ClassVarsDecl>(&member);
      const std::vector<Modifier> mods = normalize_modifiers(group->modifiers);
      for (const ClassVar * var : group->vars) {
        out.push_back(
          make_def(file, DefKind::Property, var->name, var->nameRange, var->get_range(), mods));
      }
      return;
    }

    case NodeKind::XhpAttrDecl: {
      const ClassVar * var = cast<XhpAttrDecl>(&member)->var;
      out.push_back(make_def(file, DefKind::Property, var->name, var->nameRange, var->get_range()));
      return;
    }

    case NodeKind::ClassConstDecl:
      for (const ConstEntry * entry : cast<ClassConstDecl>(&member)->entries) {
        out.push_back(make_def(
          file, DefKind::Const, entry->name, entry->nameRange,
          span_between(entry->nameRange, get_range(entry->value))));
      }
      return;

    case NodeKind::AbsConstDecl: {
      const auto * abs = cast<AbsConstDecl>(&member);
      out.push_back(make_def(
        file, DefKind::Const, abs->name, abs->nameRange, abs->nameRange, {Modifier::Abstract}));
      return;
    }

    case NodeKind::TypeConstDecl: {
      const auto * tc = cast<TypeConstDecl>(&member);
      std::vector<Modifier> mods;
      if (tc->isAbstract) {
        mods.push_back(Modifier::Abstract);
      }
      out.push_back(make_def(
        file, DefKind::Typeconst, tc->name, tc->nameRange, tc->get_range(), std::move(mods)));
      return;
    }

    // Members without an outline entry
    case NodeKind::TraitUseDecl:
    case NodeKind::ClassRequireDecl:
    case NodeKind::XhpCategoryDecl:
    case NodeKind::XhpChildrenDecl:
      return;

    // Not class members
#define AST_NODE_EXPR(Class, Kind, Snake) case NodeKind::Kind:
#define AST_NODE_DECL(Class, Kind, Snake) case NodeKind::Kind:
#define AST_NODE_SUPPORT(Class, Kind, Snake) case NodeKind::Kind:
#define AST_NODE_TOP(Class, Kind, Snake) case NodeKind::Kind:
#include "hh_outline/ast/ast_nodes.def"
      return;
  }
}

Outline outline_program(const SourceFile & file, const Program & program)
{
  Outline out;
  for (const Decl * decl : program.decls) {
    if (const auto * fn = dyn_cast<FunDecl>(decl)) {
      out.push_back(summarize_function(file, *fn));
    } else if (const auto * cls = dyn_cast<ClassDecl>(decl)) {
      out.push_back(summarize_class(file, *cls));
    }
  }
  return out;
}

Outline outline(std::string content, std::filesystem::path path)
{
  const auto parsed = parse_best_effort(std::move(content), std::move(path));
  return outline_program(parsed->source, *parsed->program);
}

}  // namespace hh_outline
