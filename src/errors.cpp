#include "errors.hpp"

G_DEFINE_QUARK(whispertrigger-error-quark, whispertrigger_error)
