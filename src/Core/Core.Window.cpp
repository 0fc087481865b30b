module;
#include <GLFW/glfw3.h>
#include <chrono>
#include <thread>

module Core:Window.Impl;
import :Logging;
import :Window;

namespace Core::Windowing
{
    static bool s_GLFWInitialized = false;

    class GLFWLifetime
    {
    public:
        static GLFWLifetime& Instance()
        {
            static GLFWLifetime instance;
            return instance;
        }

        ~GLFWLifetime()
        {
            if (s_GLFWInitialized)
            {
                glfwTerminate();
                s_GLFWInitialized = false;
            }
        }

    private:
        GLFWLifetime() = default;
        GLFWLifetime(const GLFWLifetime&) = delete;
        GLFWLifetime& operator=(const GLFWLifetime&) = delete;
    };

    static void GLFWErrorCallback(int error, const char* description)
    {
        Log::Error("GLFW Error ({0}): {1}", error, description);
    }

    Window::Window(const WindowProps& props)
    {
        Init(props);
    }

    Window::~Window()
    {
        Shutdown();
    }

    void Window::Init(const WindowProps& props)
    {
        m_Data.Title = props.Title;
        m_Data.WindowWidth = props.WindowWidth;
        m_Data.WindowHeight = props.WindowHeight;
        m_Data.VSync = props.VSync;
        m_Data.CloseOnEscape = props.CloseOnEscape;

        Log::Info("Creating Window {0} ({1}x{2}, vsync {3})", props.Title, props.WindowWidth,
                  props.WindowHeight, props.VSync ? "on" : "off");

        [[maybe_unused]] auto& lifetime = GLFWLifetime::Instance();

        if (!s_GLFWInitialized)
        {
            if (!glfwInit())
            {
                Log::Error("Could not initialize GLFW!");
                m_IsValid = false;
                return;
            }
            glfwSetErrorCallback(GLFWErrorCallback);
            s_GLFWInitialized = true;
        }

        // Vulkan only, no OpenGL context
        glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);

        GLFWwindow* glfwWindow = glfwCreateWindow(m_Data.WindowWidth, m_Data.WindowHeight,
                                                  m_Data.Title.c_str(), nullptr, nullptr);
        if (!glfwWindow)
        {
            Log::Error("Failed to create GLFW window!");
            m_IsValid = false;
            return;
        }

        m_Window = glfwWindow;
        m_IsValid = true;

        glfwSetWindowUserPointer(glfwWindow, &m_Data);

        glfwSetFramebufferSizeCallback(glfwWindow, [](GLFWwindow* window, int width, int height)
        {
            WindowData& data = *static_cast<WindowData*>(glfwGetWindowUserPointer(window));
            data.WindowWidth = width;
            data.WindowHeight = height;
            if (data.Callback)
            {
                data.Callback(WindowResizeEvent{width, height});
            }
        });

        glfwSetWindowCloseCallback(glfwWindow, [](GLFWwindow* window)
        {
            WindowData& data = *static_cast<WindowData*>(glfwGetWindowUserPointer(window));
            if (data.Callback)
            {
                data.Callback(WindowCloseEvent{});
            }
        });

        glfwSetKeyCallback(glfwWindow, [](GLFWwindow* window, int key, [[maybe_unused]] int scancode, int action,
                                          [[maybe_unused]] int mods)
        {
            WindowData& data = *static_cast<WindowData*>(glfwGetWindowUserPointer(window));

            if (action != GLFW_PRESS && action != GLFW_RELEASE) return;

            if (data.CloseOnEscape && key == GLFW_KEY_ESCAPE && action == GLFW_PRESS)
            {
                glfwSetWindowShouldClose(window, GLFW_TRUE);
            }

            if (data.Callback)
            {
                data.Callback(KeyEvent{key, action == GLFW_PRESS});
            }
        });
    }

    void Window::Shutdown()
    {
        if (m_Window)
        {
            glfwDestroyWindow(static_cast<GLFWwindow*>(m_Window));
            m_Window = nullptr;
        }
    }

    void Window::OnUpdate()
    {
        if (!m_IsValid) return;
        glfwPollEvents();
    }

    bool Window::ShouldClose() const
    {
        if (!m_IsValid) return true;
        return glfwWindowShouldClose(static_cast<GLFWwindow*>(m_Window));
    }

    int Window::GetRefreshRate() const
    {
        if (!m_IsValid) return 0;

        GLFWmonitor* monitor = glfwGetPrimaryMonitor();
        if (!monitor) return 0;
        const GLFWvidmode* mode = glfwGetVideoMode(monitor);
        if (!mode) return 0;
        return mode->refreshRate;
    }

    void FramePacer::SetRefreshRate(int refreshRateHz)
    {
        m_Next.reset();
        if (refreshRateHz <= 0)
        {
            m_Period = Clock::duration::zero();
            return;
        }
        m_Period = std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(1)) / refreshRateHz;
    }

    FramePacer::Clock::time_point FramePacer::NextDeadline(Clock::time_point now)
    {
        if (!IsEnabled()) return now;

        Clock::time_point deadline = m_Next.value_or(now);
        if (now - deadline > m_Period)
            deadline = now;

        m_Next = deadline + m_Period;
        return deadline;
    }

    void FramePacer::Wait()
    {
        if (!IsEnabled()) return;
        std::this_thread::sleep_until(NextDeadline(Clock::now()));
    }
}
