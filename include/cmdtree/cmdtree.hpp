#ifndef CMDTREE_CMDTREE_HPP
#define CMDTREE_CMDTREE_HPP

#include "binder.hpp"
#include "context.hpp"
#include "diagnostic.hpp"
#include "dispatcher.hpp"
#include "exit_code.hpp"
#include "help.hpp"
#include "hooks.hpp"
#include "model.hpp"
#include "prompt.hpp"
#include "resolver.hpp"
#include "types.hpp"
#include "utils.hpp"
#include "validation.hpp"
#include "value.hpp"

#endif // CMDTREE_CMDTREE_HPP
