module;
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <variant>

export module Core:Window;

export namespace Core::Windowing
{
    struct WindowProps
    {
        std::string Title = "Slime Simulation";
        int WindowWidth = 1280;
        int WindowHeight = 720;
        bool VSync = true;
        bool CloseOnEscape = true;
    };

    struct WindowCloseEvent
    {
    };

    struct WindowResizeEvent
    {
        int Width;
        int Height;
    };

    struct KeyEvent
    {
        int KeyCode;
        bool IsPressed;
    };

    using Event = std::variant<WindowCloseEvent, WindowResizeEvent, KeyEvent>;

    using EventCallbackFn = std::function<void(const Event&)>;

    class Window
    {
    public:
        explicit Window(const WindowProps& props);
        ~Window();

        Window(const Window&) = delete;
        Window& operator=(const Window&) = delete;

        void OnUpdate(); // Polls events; call once per frame

        [[nodiscard]] bool ShouldClose() const;
        [[nodiscard]] void* GetNativeHandle() const { return m_Window; } // GLFWwindow*
        [[nodiscard]] int GetWindowWidth() const { return m_Data.WindowWidth; }
        [[nodiscard]] int GetWindowHeight() const { return m_Data.WindowHeight; }
        [[nodiscard]] bool IsVSync() const { return m_Data.VSync; }
        // Primary monitor's refresh rate in Hz; 0 when unknown.
        [[nodiscard]] int GetRefreshRate() const;
        [[nodiscard]] bool IsValid() const { return m_IsValid; }

        void SetEventCallback(const EventCallbackFn& callback) { m_Data.Callback = callback; }

    private:
        void* m_Window = nullptr;
        bool m_IsValid = false;

        struct WindowData
        {
            std::string Title;
            int WindowWidth = 0;
            int WindowHeight = 0;
            bool VSync = true;
            bool CloseOnEscape = true;
            EventCallbackFn Callback;
        };

        WindowData m_Data;

        void Init(const WindowProps& props);
        void Shutdown();
    };

    // Caps the frame loop at the display rate. Nothing is presented, so this
    // stands in for the swapchain's FIFO wait. Deadlines sit on a fixed grid
    // from the first frame; a frame more than one period late restarts the grid.
    class FramePacer
    {
    public:
        using Clock = std::chrono::steady_clock;

        explicit FramePacer(int refreshRateHz = 0) { SetRefreshRate(refreshRateHz); }

        // 0 or less disables pacing.
        void SetRefreshRate(int refreshRateHz);

        [[nodiscard]] bool IsEnabled() const { return m_Period != Clock::duration::zero(); }
        [[nodiscard]] Clock::duration GetPeriod() const { return m_Period; }

        // Earliest start of the frame about to run, given the current time.
        [[nodiscard]] Clock::time_point NextDeadline(Clock::time_point now);

        // Sleeps until NextDeadline(now).
        void Wait();

    private:
        Clock::duration m_Period = Clock::duration::zero();
        std::optional<Clock::time_point> m_Next;
    };
}
