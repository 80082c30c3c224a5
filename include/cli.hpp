#pragma once
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include "migrator.hpp"

#define EXIT_OK    0
#define EXIT_FATAL 1
#define EXIT_USAGE 2

using TaskArgs = std::vector<std::string>;

struct Task {
    std::function<void(const TaskArgs&)> run;
    std::string usage;
};

using TaskTable = std::map<std::string, Task>;

// "sync [noprompt]" and "pending", bound to @p migrator.
TaskTable migrator_tasks(Migrator& migrator);

/**
 * @brief Runs the task named by args[0]; the remaining args go to the task.
 *
 * Usage problems ("No task given", "No such task") are printed on @p out and
 * return EXIT_USAGE. A task throwing std::exception prints "Error: ..." on
 * @p err and returns EXIT_FATAL.
 */
int dispatch(const TaskTable& tasks, const TaskArgs& args, std::ostream& out, std::ostream& err);
