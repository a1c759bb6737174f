#ifndef MICA_FORWARD_HH
#define MICA_FORWARD_HH

namespace mica {
class File;
class Context;
class Target;
class Type;
class NativeType;
class StructLayoutTable;
class AbiStrategy;
struct Module;
struct Term;
struct Expr;
} // namespace mica

#endif // MICA_FORWARD_HH
