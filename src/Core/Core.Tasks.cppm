module;

#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

export module Core:Tasks;

export namespace Core::Tasks
{
    // Fixed-size, non-allocating type-erased callable. Captures must fit in
    // STORAGE_SIZE bytes; capture pointers or shared_ptrs for larger state.
    class LocalTask
    {
        static constexpr size_t STORAGE_SIZE = 120;

        struct Concept
        {
            virtual ~Concept() = default;
            virtual void Execute() = 0;
            virtual void MoveTo(void* dest) = 0;
        };

        template <typename T>
        struct Model final : Concept
        {
            T payload;

            explicit Model(T&& p) : payload(std::move(p))
            {
            }

            void Execute() override { payload(); }

            void MoveTo(void* dest) override
            {
                std::construct_at(static_cast<Model<T>*>(dest), std::move(payload));
            }
        };

        alignas(8) std::byte m_Storage[STORAGE_SIZE];
        Concept* m_VTable = nullptr;

    public:
        LocalTask() = default;

        template <typename F>
            requires (!std::is_same_v<std::decay_t<F>, LocalTask>)
        LocalTask(F&& f)
        {
            using Type = std::decay_t<F>;
            static_assert(sizeof(Model<Type>) <= STORAGE_SIZE,
                          "Task lambda capture is too big! Use pointers or simplify captures.");
            static_assert(alignof(Model<Type>) <= alignof(std::max_align_t),
                          "Task alignment requirement too strict.");

            Type copy(std::forward<F>(f));
            auto* ptr = reinterpret_cast<Model<Type>*>(m_Storage);
            std::construct_at(ptr, std::move(copy));
            m_VTable = ptr;
        }

        ~LocalTask();

        LocalTask(LocalTask&& other) noexcept;
        LocalTask& operator=(LocalTask&& other) noexcept;

        LocalTask(const LocalTask&) = delete;
        LocalTask& operator=(const LocalTask&) = delete;

        void operator()();

        [[nodiscard]] bool Valid() const { return m_VTable != nullptr; }
    };

    // Process-wide worker pool. Asset decoding and pipeline compilation are
    // dispatched here; the frame loop never blocks on them.
    //
    // When the pool is not running, Dispatch executes the task inline on the
    // calling thread so tools and tests without workers still make progress.
    class Scheduler
    {
    public:
        static void Initialize(unsigned threadCount = 0);
        static void Shutdown();

        [[nodiscard]] static bool IsRunning();
        [[nodiscard]] static unsigned WorkerCount();

        template <typename F>
        static void Dispatch(F&& task)
        {
            DispatchInternal(LocalTask(std::forward<F>(task)));
        }

        // Blocks until every dispatched task has finished. The calling thread
        // helps drain the queue while it waits.
        static void WaitForAll();

    private:
        static void DispatchInternal(LocalTask&& task);
        static void WorkerEntry(unsigned threadIndex);
    };
}
