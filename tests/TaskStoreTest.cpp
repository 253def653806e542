// =================================================================
// tests/TaskStoreTest.cpp
// =================================================================
// Unit tests for the task stores.

#include "Maestro/TaskStore.hpp"
#include "Maestro/Logger.hpp"
#include <iostream>
#include <cassert>
#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;

class TaskStoreTest {
private:
    fs::path m_dir;

    Maestro::Task makeTask(const std::string& id, Maestro::TaskStatus status = Maestro::TaskStatus::PENDING) {
        Maestro::Task task;
        task.id = id;
        task.description = "Task " + id;
        task.requirements = {"research"};
        task.context = {{"owner", "tests"}};
        task.status = status;
        return task;
    }

    Maestro::Result makeResult(const std::string& task_id, bool success, double quality) {
        Maestro::Result result;
        result.task_id = task_id;
        result.success = success;
        result.quality_score = quality;
        result.agent_id = "worker-1";
        result.payload = {{"answer", 42}};
        result.metadata["outcome"] = success ? "succeeded" : "failed";
        return result;
    }

public:
    TaskStoreTest() {
        Maestro::Logger::getInstance().setConsoleLogging(false);
        Maestro::Logger::getInstance().setFileLogging(false);
        m_dir = fs::temp_directory_path() / "maestro_task_store_test";
        fs::remove_all(m_dir);
    }

    ~TaskStoreTest() {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
    }

    void testInMemoryStore() {
        std::cout << "Testing in-memory task store..." << std::endl;

        Maestro::InMemoryTaskStore store;
        store.saveTask(makeTask("a"));
        store.saveTask(makeTask("b", Maestro::TaskStatus::COMPLETED));
        store.saveTask(makeTask("c", Maestro::TaskStatus::FAILED));

        // Re-saving updates in place and keeps the original position
        store.saveTask(makeTask("a", Maestro::TaskStatus::COMPLETED));

        auto all = store.queryTasks(std::nullopt, 0);
        assert(all.size() == 3);
        assert(all[0].id == "a" && all[1].id == "b" && all[2].id == "c");
        assert(all[0].status == Maestro::TaskStatus::COMPLETED);

        auto completed = store.queryTasks(Maestro::TaskStatus::COMPLETED, 0);
        assert(completed.size() == 2);

        auto limited = store.queryTasks(std::nullopt, 1);
        assert(limited.size() == 1);
        assert(limited[0].id == "a");

        store.saveResult(makeResult("b", true, 0.9));
        auto result = store.getResult("b");
        assert(result.has_value());
        assert(result->quality_score == 0.9);
        assert(!store.getResult("a").has_value());

        std::cout << "✓ In-memory store test passed" << std::endl;
    }

    void testJsonlStore() {
        std::cout << "Testing JSON lines task store..." << std::endl;

        fs::path path = m_dir / "nested" / "tasks.jsonl";
        Maestro::JsonlTaskStore store(path.string());
        assert(store.queryTasks(std::nullopt, 0).empty() && "Missing file reads as empty");
        assert(!store.getResult("x").has_value());

        store.saveTask(makeTask("first"));
        store.saveTask(makeTask("second"));
        store.saveTask(makeTask("first", Maestro::TaskStatus::IN_PROGRESS));
        store.saveTask(makeTask("first", Maestro::TaskStatus::COMPLETED));
        assert(fs::exists(path) && "Parent directories are created on first save");

        auto tasks = store.queryTasks(std::nullopt, 0);
        assert(tasks.size() == 2);
        assert(tasks[0].id == "first" && "Order of first appearance is kept");
        assert(tasks[0].status == Maestro::TaskStatus::COMPLETED && "Latest line wins");
        assert(tasks[0].requirements.size() == 1);
        assert(tasks[0].context.at("owner") == "tests");

        auto pending = store.queryTasks(Maestro::TaskStatus::PENDING, 0);
        assert(pending.size() == 1);
        assert(pending[0].id == "second");

        store.saveResult(makeResult("first", false, 0.2));
        store.saveResult(makeResult("first", true, 0.8));
        auto result = store.getResult("first");
        assert(result.has_value());
        assert(result->success && "Last result for a task wins");
        assert(result->payload["answer"] == 42);
        assert(result->metadata.at("outcome") == "succeeded");

        // A new store on the same file sees the history
        Maestro::JsonlTaskStore reopened(path.string());
        assert(reopened.queryTasks(std::nullopt, 0).size() == 2);
        assert(reopened.getPath() == path.string());

        std::cout << "✓ JSON lines store test passed" << std::endl;
    }

    void testMalformedLinesSkipped() {
        std::cout << "Testing malformed line handling..." << std::endl;

        fs::create_directories(m_dir);
        fs::path path = m_dir / "torn.jsonl";
        Maestro::JsonlTaskStore store(path.string());
        store.saveTask(makeTask("kept"));
        {
            std::ofstream file(path, std::ios::app);
            file << "{\"kind\":\"task\",\"data\":{\"id\":\"torn\"\n";
            file << "\n";
        }
        store.saveTask(makeTask("after"));

        auto tasks = store.queryTasks(std::nullopt, 0);
        assert(tasks.size() == 2 && "Torn lines are skipped, the rest is read");
        assert(tasks[0].id == "kept");
        assert(tasks[1].id == "after");

        std::cout << "✓ Malformed line test passed" << std::endl;
    }

    void testUnwritablePath() {
        std::cout << "Testing unwritable store path..." << std::endl;

        fs::create_directories(m_dir);
        fs::path blocker = m_dir / "blocker";
        {
            std::ofstream file(blocker);
            file << "not a directory";
        }

        Maestro::JsonlTaskStore store((blocker / "tasks.jsonl").string());
        bool threw = false;
        try {
            store.saveTask(makeTask("x"));
        } catch (const Maestro::MaestroError& e) {
            threw = e.kind() == Maestro::ErrorKind::UNAVAILABLE;
        }
        assert(threw && "Write failures surface as UNAVAILABLE");

        std::cout << "✓ Unwritable path test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running TaskStore unit tests..." << std::endl;
        std::cout << "===============================" << std::endl << std::endl;

        testInMemoryStore();
        std::cout << std::endl;

        testJsonlStore();
        std::cout << std::endl;

        testMalformedLinesSkipped();
        std::cout << std::endl;

        testUnwritablePath();
        std::cout << std::endl;

        std::cout << "All TaskStore tests passed!" << std::endl;
    }
};

int main() {
    try {
        TaskStoreTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All TaskStore component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
