#pragma once

#include "pgmcp/catalog.hpp"
#include "pgmcp/channel.hpp"
#include "pgmcp/client.hpp"
#include "pgmcp/config.hpp"
#include "pgmcp/errors.hpp"
#include "pgmcp/process.hpp"
#include "pgmcp/resolver.hpp"
#include "pgmcp/types.hpp"
#include "pgmcp/utils.hpp"
