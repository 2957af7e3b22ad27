#ifndef STRATA_STRATA_HPP
#define STRATA_STRATA_HPP

// Core headers. JSON and TOML parsers live in json_parser.hpp and
// toml_parser.hpp and need the strata_json / strata_toml targets.

#include "command.hpp"
#include "convert.hpp"
#include "env.hpp"
#include "environment.hpp"
#include "error.hpp"
#include "flag.hpp"
#include "flag_set.hpp"
#include "flatten.hpp"
#include "help.hpp"
#include "node.hpp"
#include "options.hpp"
#include "parse.hpp"
#include "parsers.hpp"
#include "utils.hpp"
#include "value.hpp"
#include "yaml_parser.hpp"

#endif // STRATA_STRATA_HPP
