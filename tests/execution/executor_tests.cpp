#include <gtest/gtest.h>
#include "modpipe/common/pipeline_exceptions.hpp"
#include "modpipe/execution/module_task.hpp"
#include "modpipe/execution/single_threaded_executor.hpp"
#include "modpipe/execution/thread_pool_executor.hpp"
#include <thread>

using namespace modpipe;

// =============================================================================
// Test Implementations
// =============================================================================

namespace
{

/**
 * @brief Module whose behavior is given as a callable.
 */
class LambdaModule : public IContentModule
{
public:
    using Body = std::function<ModuleOutput(const ModuleContext&)>;

    explicit LambdaModule(Body body)
        : m_body(std::move(body))
    {}

    ModuleOutput execute(const ModuleContext& context) const override
    {
        return m_body(context);
    }

    const std::string& class_name() const override
    {
        static const std::string name = "LambdaModule";
        return name;
    }

private:
    Body m_body;
};

/**
 * @brief Module that always declines to run.
 */
class DecliningModule : public IContentModule
{
public:
    std::optional<std::string> validate_input(const ModuleContext&) const override
    {
        return std::string("nothing to do");
    }

    ModuleOutput execute(const ModuleContext&) const override
    {
        ADD_FAILURE() << "execute() must not run after validate_input() declined";
        return {};
    }

    const std::string& class_name() const override
    {
        static const std::string name = "DecliningModule";
        return name;
    }
};

ModuleTaskPtr make_task(ContentModulePtr module, const std::string& id = "m")
{
    auto descriptor = std::make_shared<ModuleDescriptor>();
    descriptor->id = id;
    auto stop_flag = std::make_shared<std::atomic<bool>>(false);
    auto context = std::make_shared<ModuleContext>(descriptor, nullptr, nullptr, stop_flag);
    return std::make_shared<ModuleTask>(std::move(module), std::move(context), stop_flag);
}

ModuleTaskPtr make_task(LambdaModule::Body body, const std::string& id = "m")
{
    return make_task(std::make_shared<LambdaModule>(std::move(body)), id);
}

} // namespace

// =============================================================================
// ModuleTask
// =============================================================================

TEST(ModuleTaskTests, Run_StoresOutputAndDuration)
{
    auto task = make_task([](const ModuleContext&) { return ModuleOutput::with_content("hello"); });
    EXPECT_EQ(task->state(), TaskState::Queued);

    task->run();

    EXPECT_EQ(task->state(), TaskState::Finished);
    EXPECT_EQ(task->output().content, "hello");
    EXPECT_FALSE(task->exception());
    EXPECT_FALSE(task->skip_reason().has_value());
    EXPECT_GE(task->duration().count(), 0);
}

TEST(ModuleTaskTests, Run_CapturesException)
{
    auto task = make_task([](const ModuleContext&) -> ModuleOutput { throw std::runtime_error("boom"); });
    EXPECT_NO_THROW(task->run());

    EXPECT_EQ(task->state(), TaskState::Finished);
    ASSERT_TRUE(task->exception());
    EXPECT_THROW(std::rethrow_exception(task->exception()), std::runtime_error);
}

TEST(ModuleTaskTests, Run_DecliningModule_RecordsSkipReason)
{
    auto task = make_task(std::make_shared<DecliningModule>());
    task->run();

    ASSERT_TRUE(task->skip_reason().has_value());
    EXPECT_EQ(*task->skip_reason(), "nothing to do");
}

TEST(ModuleTaskTests, Cancel_BeforeRun_PreventsExecution)
{
    bool executed = false;
    auto task = make_task([&executed](const ModuleContext&) {
        executed = true;
        return ModuleOutput{};
    });

    EXPECT_TRUE(task->cancel());
    task->run();

    EXPECT_FALSE(executed);
    EXPECT_EQ(task->state(), TaskState::Cancelled);
    EXPECT_TRUE(task->wait_until_finished(std::nullopt));
}

TEST(ModuleTaskTests, Cancel_AfterRun_ReturnsFalse)
{
    auto task = make_task([](const ModuleContext&) { return ModuleOutput{}; });
    task->run();
    EXPECT_FALSE(task->cancel());
    EXPECT_EQ(task->state(), TaskState::Finished);
}

TEST(ModuleTaskTests, RequestStop_IsVisibleToModule)
{
    std::atomic<bool> entered{false};
    auto task = make_task([&entered](const ModuleContext& context) {
        entered = true;
        while (!context.stop_requested())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return ModuleOutput::with_content("stopped");
    });

    std::thread runner([task]() { task->run(); });
    EXPECT_TRUE(task->wait_until_started(Clock::now() + std::chrono::seconds(5)));
    task->request_stop();
    EXPECT_TRUE(task->wait_until_finished(Clock::now() + std::chrono::seconds(5)));
    runner.join();

    EXPECT_TRUE(entered.load());
    EXPECT_EQ(task->output().content, "stopped");
}

TEST(ModuleTaskTests, WaitUntilFinished_DeadlinePasses_ReturnsFalse)
{
    auto task = make_task([](const ModuleContext&) { return ModuleOutput{}; });
    EXPECT_FALSE(task->wait_until_finished(Clock::now() + std::chrono::milliseconds(10)));
}

// =============================================================================
// SingleThreadedExecutor
// =============================================================================

TEST(SingleThreadedExecutorTests, Submit_RunsInline)
{
    auto executor = make_inline_executor();
    auto caller = std::this_thread::get_id();
    std::thread::id ran_on;
    auto task = make_task([&ran_on](const ModuleContext&) {
        ran_on = std::this_thread::get_id();
        return ModuleOutput{};
    });

    executor->submit(task);

    EXPECT_TRUE(executor->runs_inline());
    EXPECT_EQ(executor->concurrency(), 1u);
    EXPECT_EQ(task->state(), TaskState::Finished);
    EXPECT_EQ(ran_on, caller);
}

TEST(SingleThreadedExecutorTests, Submit_AfterStop_Throws)
{
    auto executor = make_inline_executor();
    executor->request_stop();
    try
    {
        executor->submit(make_task([](const ModuleContext&) { return ModuleOutput{}; }));
        FAIL() << "Expected PipelineError";
    }
    catch (const PipelineError& e)
    {
        EXPECT_EQ(e.code(), PipelineErrorCode::CancelledRun);
    }
}

// =============================================================================
// ThreadPoolExecutor
// =============================================================================

TEST(ThreadPoolExecutorTests, Submit_RunsAllTasks)
{
    auto executor = make_thread_pool_executor(ExecutorConfig{4});
    EXPECT_EQ(executor->concurrency(), 4u);
    EXPECT_FALSE(executor->runs_inline());

    std::atomic<int> count{0};
    std::vector<ModuleTaskPtr> tasks;
    for (int i = 0; i < 16; ++i)
    {
        tasks.push_back(make_task([&count](const ModuleContext&) {
            ++count;
            return ModuleOutput{};
        }));
        executor->submit(tasks.back());
    }
    for (auto& task : tasks)
    {
        EXPECT_TRUE(task->wait_until_finished(Clock::now() + std::chrono::seconds(5)));
    }
    EXPECT_EQ(count.load(), 16);
}

TEST(ThreadPoolExecutorTests, Submit_RunsTasksConcurrently)
{
    auto executor = make_thread_pool_executor(ExecutorConfig{4});
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<ModuleTaskPtr> tasks;
    for (int i = 0; i < 4; ++i)
    {
        tasks.push_back(make_task([&](const ModuleContext&) {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now))
            {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            --running;
            return ModuleOutput{};
        }));
        executor->submit(tasks.back());
    }
    for (auto& task : tasks)
    {
        EXPECT_TRUE(task->wait_until_finished(Clock::now() + std::chrono::seconds(5)));
    }
    EXPECT_GE(peak.load(), 2);
}

TEST(ThreadPoolExecutorTests, RequestStop_CancelsQueuedTasks)
{
    auto executor = make_thread_pool_executor(ExecutorConfig{1});
    std::atomic<bool> release{false};

    auto blocker = make_task([&release](const ModuleContext&) {
        while (!release)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return ModuleOutput{};
    });
    auto queued = make_task([](const ModuleContext&) { return ModuleOutput{}; });

    executor->submit(blocker);
    ASSERT_TRUE(blocker->wait_until_started(Clock::now() + std::chrono::seconds(5)));
    executor->submit(queued);
    EXPECT_EQ(executor->queued_count(), 1u);

    executor->request_stop();
    EXPECT_EQ(queued->state(), TaskState::Cancelled);
    EXPECT_EQ(executor->queued_count(), 0u);
    EXPECT_THROW(executor->submit(make_task([](const ModuleContext&) { return ModuleOutput{}; })),
                 PipelineError);

    release = true;
    EXPECT_TRUE(blocker->wait_until_finished(Clock::now() + std::chrono::seconds(5)));
}

TEST(ExecutorFactoryTests, MakeExecutor_OneWorker_IsInline)
{
    EXPECT_TRUE(make_executor(ExecutorConfig{1})->runs_inline());
    EXPECT_FALSE(make_executor(ExecutorConfig{3})->runs_inline());
}
