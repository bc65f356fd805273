#pragma once
#include <tao/pegtl.hpp>

namespace thriftlang::pegtl_front::grammar {
using namespace tao::pegtl;

// Comments and whitespace
struct comment_line : sor< seq< two<'/'>, until< eolf > >, seq< one<'#'>, until< eolf > > > {};
struct block_comment : seq< one<'/'>, one<'*'>, until< seq< one<'*'>, one<'/'> > > > {};
struct space_or_comment : sor< space, comment_line, block_comment > {};
struct sep : star< space_or_comment > {};

template<typename Rule>
using ws = pad< Rule, space_or_comment >;

struct ident_first : ranges<'a','z','A','Z','_','_'> {};
struct ident_rest : ranges<'a','z','A','Z','0','9','_','_'> {};

template<typename Str>
struct key : seq< Str, not_at< ident_rest > > {};

struct kw_include : key< TAO_PEGTL_STRING("include") > {};
struct kw_namespace : key< TAO_PEGTL_STRING("namespace") > {};
struct kw_typedef : key< TAO_PEGTL_STRING("typedef") > {};
struct kw_enum : key< TAO_PEGTL_STRING("enum") > {};
struct kw_struct : key< TAO_PEGTL_STRING("struct") > {};
struct kw_union : key< TAO_PEGTL_STRING("union") > {};
struct kw_exception : key< TAO_PEGTL_STRING("exception") > {};
struct kw_service : key< TAO_PEGTL_STRING("service") > {};
struct kw_extends : key< TAO_PEGTL_STRING("extends") > {};
struct kw_throws : key< TAO_PEGTL_STRING("throws") > {};
struct kw_oneway : key< TAO_PEGTL_STRING("oneway") > {};
struct kw_void : key< TAO_PEGTL_STRING("void") > {};
struct kw_required : key< TAO_PEGTL_STRING("required") > {};
struct kw_optional : key< TAO_PEGTL_STRING("optional") > {};
struct kw_const : key< TAO_PEGTL_STRING("const") > {};
struct kw_map : key< TAO_PEGTL_STRING("map") > {};
struct kw_list : key< TAO_PEGTL_STRING("list") > {};
struct kw_set : key< TAO_PEGTL_STRING("set") > {};
struct kw_bool : key< TAO_PEGTL_STRING("bool") > {};
struct kw_byte : key< TAO_PEGTL_STRING("byte") > {};
struct kw_i8 : key< TAO_PEGTL_STRING("i8") > {};
struct kw_i16 : key< TAO_PEGTL_STRING("i16") > {};
struct kw_i32 : key< TAO_PEGTL_STRING("i32") > {};
struct kw_i64 : key< TAO_PEGTL_STRING("i64") > {};
struct kw_double : key< TAO_PEGTL_STRING("double") > {};
struct kw_string : key< TAO_PEGTL_STRING("string") > {};
struct kw_binary : key< TAO_PEGTL_STRING("binary") > {};

struct reserved : sor< kw_include, kw_namespace, kw_typedef, kw_enum, kw_struct, kw_union, kw_exception,
                       kw_service, kw_extends, kw_throws, kw_oneway, kw_void, kw_required, kw_optional,
                       kw_const, kw_map, kw_list, kw_set, kw_bool, kw_byte, kw_i8, kw_i16, kw_i32,
                       kw_i64, kw_double, kw_string, kw_binary > {};

// Dotted identifiers name definitions of included units: shared.Foo
struct identifier : seq< not_at< reserved >, ident_first, star< ident_rest >,
                         star< one<'.'>, ident_first, star< ident_rest > > > {};

struct list_sep : one<',',';'> {};
struct literal : sor< seq< one<'"'>, until< one<'"'> > >, seq< one<'\''>, until< one<'\''> > > > {};

// Constant values (default values are kept as literal trees)
struct sign : one<'+','-'> {};
struct exponent : seq< one<'e','E'>, opt< sign >, plus< digit > > {};
struct const_double : seq< opt< sign >, plus< digit >,
                           sor< seq< one<'.'>, star< digit >, opt< exponent > >, exponent > > {};
struct const_int : seq< opt< sign >, sor< seq< one<'0'>, one<'x','X'>, plus< xdigit > >, plus< digit > > > {};
struct const_string : literal {};
struct const_ident : identifier {};
struct const_value;
struct const_list : seq< ws< one<'['> >, star< ws< const_value >, opt< ws< list_sep > > >, one<']'> > {};
struct const_map_entry : seq< ws< const_value >, ws< one<':'> >, ws< const_value >, opt< ws< list_sep > > > {};
struct const_map : seq< ws< one<'{'> >, star< const_map_entry >, one<'}'> > {};
struct const_value : sor< const_double, const_int, const_string, const_ident, const_list, const_map > {};

// Types
struct field_type;
struct base_type : sor< kw_bool, kw_byte, kw_i8, kw_i16, kw_i32, kw_i64, kw_double, kw_string, kw_binary > {};
struct map_type : seq< kw_map, sep, one<'<'>, ws< field_type >, one<','>, ws< field_type >, one<'>'> > {};
struct list_type : seq< kw_list, sep, one<'<'>, ws< field_type >, one<'>'> > {};
struct set_type : seq< kw_set, sep, one<'<'>, ws< field_type >, one<'>'> > {};
struct named_type : identifier {};
struct field_type : sor< map_type, list_type, set_type, base_type, named_type > {};

// Fields: [id:] [required|optional] type name [= value] [,|;]
struct field_id : seq< opt< sign >, plus< digit > > {};
struct field_name : identifier {};
struct field_default : seq< ws< one<'='> >, ws< const_value > > {};
struct field : seq< opt< seq< ws< field_id >, ws< one<':'> > > >,
                    opt< ws< sor< kw_required, kw_optional > > >,
                    ws< field_type >, ws< field_name >,
                    opt< field_default >,
                    opt< ws< list_sep > > > {};

// Functions: [oneway] (void|type) name(fields) [throws (fields)] [,|;]
struct function_name : identifier {};
struct throws_clause : seq< ws< kw_throws >, ws< one<'('> >, star< field >, ws< one<')'> > > {};
struct function : seq< opt< ws< kw_oneway > >, ws< sor< kw_void, field_type > >, ws< function_name >,
                       must< ws< one<'('> >, star< field >, ws< one<')'> > >,
                       opt< throws_clause >, opt< ws< list_sep > > > {};

// Headers
struct include_path : literal {};
struct include_decl : seq< ws< kw_include >, must< ws< include_path > > > {};
struct namespace_scope : sor< one<'*'>, identifier > {};
struct namespace_name : identifier {};
struct namespace_decl : seq< ws< kw_namespace >, must< ws< namespace_scope >, ws< namespace_name > > > {};
struct header : sor< include_decl, namespace_decl > {};

// Definitions
struct def_name : identifier {};
struct extends_name : identifier {};
struct item_name : identifier {};
struct enum_value : const_int {};
struct enum_item : seq< ws< item_name >, opt< ws< one<'='> >, ws< enum_value > >, opt< ws< list_sep > > > {};
struct typedef_decl : seq< ws< kw_typedef >, must< ws< field_type >, ws< def_name > >, opt< ws< list_sep > > > {};
struct enum_decl : seq< ws< kw_enum >, must< ws< def_name >, ws< one<'{'> >, star< enum_item >, ws< one<'}'> > > > {};
template<typename Kw>
struct struct_like : seq< ws< Kw >, must< ws< def_name >, ws< one<'{'> >, star< field >, ws< one<'}'> > > > {};
struct struct_decl : struct_like< kw_struct > {};
struct union_decl : struct_like< kw_union > {};
struct exception_decl : struct_like< kw_exception > {};
struct service_decl : seq< ws< kw_service >, must< ws< def_name > >,
                           opt< ws< kw_extends >, must< ws< extends_name > > >,
                           must< ws< one<'{'> >, star< function >, ws< one<'}'> > > > {};
struct definition : sor< typedef_decl, enum_decl, struct_decl, union_decl, exception_decl, service_decl > {};

struct document : seq< sep, star< header >, star< definition >, must< eof > > {};

} // namespace thriftlang::pegtl_front::grammar
