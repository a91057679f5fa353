#pragma once

#include "ito/audit/v1/event.pb.h"

#include "internal/audit/context.hpp"
#include "internal/audit/event.hpp"
#include "internal/audit/fs_writer.hpp"
#include "internal/audit/materialize.hpp"
#include "internal/audit/reader.hpp"
#include "internal/audit/reconcile.hpp"
#include "internal/audit/stats.hpp"
#include "internal/audit/stream.hpp"
#include "internal/audit/validate.hpp"
#include "internal/audit/worktree.hpp"
#include "internal/audit/writer.hpp"
