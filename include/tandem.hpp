#pragma once

#include "tandem/aggregator.hpp"
#include "tandem/cli.hpp"
#include "tandem/config.hpp"
#include "tandem/errors.hpp"
#include "tandem/finding.hpp"
#include "tandem/format.hpp"
#include "tandem/harness.hpp"
#include "tandem/invoker.hpp"
#include "tandem/matrix.hpp"
#include "tandem/process.hpp"
#include "tandem/result.hpp"
#include "tandem/suppression.hpp"
#include "tandem/toolchain.hpp"
#include "tandem/utils.hpp"
