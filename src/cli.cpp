#include "cli.hpp"
#include <algorithm>
#include "log.hpp"

namespace {

    void print_usage(const TaskTable& tasks, std::ostream& out) {
        out << "Tasks:" << '\n';
        for (const auto& [name, task] : tasks) out << "  " << task.usage << '\n';
        out << std::flush;
    }
}

TaskTable migrator_tasks(Migrator& migrator) {
    TaskTable tasks;
    tasks["sync"] = Task {
        [&migrator](const TaskArgs& args) {
            const bool no_prompt = std::find(args.begin(), args.end(), "noprompt") != args.end();
            migrator.sync(no_prompt);
        },
        "sync [noprompt]   bring the live database in line with the schema folder",
    };
    tasks["pending"] = Task {
        [&migrator](const TaskArgs&) { migrator.pending(); },
        "pending           write what production still needs to the pending file",
    };
    return tasks;
}

int dispatch(const TaskTable& tasks, const TaskArgs& args, std::ostream& out, std::ostream& err) {
    if (args.empty()) {
        out << "No task given" << std::endl;
        print_usage(tasks, out);
        return EXIT_USAGE;
    }
    auto it = tasks.find(args.front());
    if (it == tasks.end()) {
        out << "No such task" << std::endl;
        print_usage(tasks, out);
        return EXIT_USAGE;
    }

    try {
        it->second.run(TaskArgs(args.begin() + 1, args.end()));
    } catch (const std::exception& ex) {
        LOG_ERROR("task '{}' failed: {}", it->first, ex.what());
        err << "Error: " << ex.what() << std::endl;
        return EXIT_FATAL;
    }
    return EXIT_OK;
}
