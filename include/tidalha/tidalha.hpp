// filename: tidalha.hpp
// part of Tidal Harmonic Analysis Driver
// MIT License

#pragma once

#include "completion_watcher.hpp"
#include "errors.hpp"
#include "job_template.hpp"
#include "mesh_index.hpp"
#include "orchestrator.hpp"
#include "partition.hpp"
#include "result_assembler.hpp"
#include "run_config.hpp"
#include "scheduler.hpp"
#include "task_launcher.hpp"
#include "types.hpp"
