#include "ui/DeveloperConsole.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <vector>

#include "engine/core/EventBus.hpp"
#include "engine/platform/Window.hpp"
#include "game/gameplay/Game.hpp"

#if BUILD_WITH_IMGUI
#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>
#endif

namespace ui
{
#if BUILD_WITH_IMGUI
struct DeveloperConsole::Impl
{
    explicit Impl(ConsoleCommands& commandsIn)
        : commands(commandsIn)
    {
    }

    ConsoleCommands& commands;

    bool open = false;
    bool firstOpenAnnouncementDone = false;
    bool reclaimFocus = false;

    std::array<char, 256> inputBuffer{};
    int historyPos = -1;

    static int TextEditCallbackStub(ImGuiInputTextCallbackData* data)
    {
        Impl* impl = static_cast<Impl*>(data->UserData);
        return impl->TextEditCallback(data);
    }

    int TextEditCallback(ImGuiInputTextCallbackData* data)
    {
        switch (data->EventFlag)
        {
            case ImGuiInputTextFlags_CallbackCompletion:
            {
                const char* wordEnd = data->Buf + data->CursorPos;
                const char* wordStart = wordEnd;
                while (wordStart > data->Buf && wordStart[-1] != ' ' && wordStart[-1] != '\t')
                {
                    --wordStart;
                }

                const std::vector<std::string> candidates = commands.CompletionCandidates(std::string(wordStart, wordEnd));
                if (candidates.size() == 1)
                {
                    data->DeleteChars(static_cast<int>(wordStart - data->Buf), static_cast<int>(wordEnd - wordStart));
                    data->InsertChars(data->CursorPos, candidates[0].c_str());
                    data->InsertChars(data->CursorPos, " ");
                }
                else if (candidates.size() > 1)
                {
                    commands.AddLog("Possible matches:");
                    for (const std::string& candidate : candidates)
                    {
                        commands.AddLog("  " + candidate);
                    }
                }
                break;
            }
            case ImGuiInputTextFlags_CallbackHistory:
            {
                const std::vector<std::string>& history = commands.History();
                const int previousHistoryPos = historyPos;
                if (data->EventKey == ImGuiKey_UpArrow)
                {
                    if (historyPos == -1)
                    {
                        historyPos = static_cast<int>(history.size()) - 1;
                    }
                    else if (historyPos > 0)
                    {
                        --historyPos;
                    }
                }
                else if (data->EventKey == ImGuiKey_DownArrow)
                {
                    if (historyPos != -1)
                    {
                        if (++historyPos >= static_cast<int>(history.size()))
                        {
                            historyPos = -1;
                        }
                    }
                }

                if (previousHistoryPos != historyPos)
                {
                    const char* historyText = (historyPos >= 0) ? history[static_cast<size_t>(historyPos)].c_str() : "";
                    data->DeleteChars(0, data->BufTextLen);
                    data->InsertChars(0, historyText);
                }
                break;
            }
            default:
                break;
        }

        return 0;
    }

    void DrawDebugHud(const ConsoleContext& context, float fps) const
    {
        if (context.game == nullptr)
        {
            return;
        }
        const game::gameplay::Game& game = *context.game;

        ImGuiViewport* viewport = ImGui::GetMainViewport();
        ImGui::SetNextWindowBgAlpha(0.56F);
        ImGui::SetNextWindowPos(
            ImVec2(viewport->Pos.x + viewport->Size.x - 12.0F, viewport->Pos.y + 12.0F),
            ImGuiCond_FirstUseEver,
            ImVec2(1.0F, 0.0F)
        );
        if (ImGui::Begin("Debug HUD", nullptr, ImGuiWindowFlags_AlwaysAutoResize))
        {
            ImGui::Text("FPS: %.1f", fps);
            ImGui::Text("Frame: %llu", static_cast<unsigned long long>(game.Frame()));
            ImGui::Text("Phase: %s", game::gameplay::Game::PhaseToText(game.Phase()));
            ImGui::Text("Difficulty: %s", game.GetDifficulty().name.c_str());
            ImGui::Separator();
            ImGui::Text("Score: %d", game.Score());
            ImGui::Text("Failures: %d/%d", game.Failures(), game.Tuning().missLimit);
            ImGui::Text("Packages: %d/%d", static_cast<int>(game.Packages().size()), game.MaxPackages());
            ImGui::Text("Spawn timer: %d", game.SpawnTimer());
            ImGui::Text("Belts resting: %s", game.BeltsResting() ? "yes" : "no");
            ImGui::Separator();

            const game::gameplay::Truck& truck = game.GetTruck();
            ImGui::Text(
                "Truck: %s x=%d load=%d/%d",
                game::gameplay::Truck::StateToText(truck.State()),
                truck.X(),
                truck.Load(),
                truck.Capacity()
            );
            ImGui::Text("Deliveries: %d", truck.Deliveries());
            ImGui::Separator();

            for (const game::gameplay::Character* character : {&game.Mario(), &game.Luigi()})
            {
                ImGui::Text(
                    "%s: floor %d/%d lane %d %s catches %d",
                    character->Name().c_str(),
                    character->Floor(),
                    character->MaxFloor(),
                    character->ServedLane(),
                    game::gameplay::Character::StateToText(character->State()),
                    character->CatchCount()
                );
            }

            if (ImGui::CollapsingHeader("Lanes"))
            {
                const std::vector<float>& speeds = game.LaneSpeeds();
                for (std::size_t lane = 0; lane < speeds.size(); ++lane)
                {
                    ImGui::Text(
                        "Lane %d: speed %.1f period %d",
                        static_cast<int>(lane),
                        speeds[lane],
                        game.Layout().TickPeriod(speeds[lane])
                    );
                }
            }

            if (context.eventBus != nullptr && ImGui::CollapsingHeader("Recent events"))
            {
                const auto& history = context.eventBus->History();
                const std::size_t shown = std::min<std::size_t>(history.size(), 10U);
                for (std::size_t i = history.size() - shown; i < history.size(); ++i)
                {
                    ImGui::TextUnformatted(history[i].ToString().c_str());
                }
            }
        }
        ImGui::End();
    }
};
#endif

bool DeveloperConsole::Initialize(engine::platform::Window& window)
{
#if BUILD_WITH_IMGUI
    m_impl = new Impl(m_commands);
    m_commands.AddLog("Developer console ready. Press ~ to toggle.");

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(window.NativeHandle(), true);
    ImGui_ImplOpenGL3_Init("#version 450");
#else
    (void)window;
#endif
    return true;
}

void DeveloperConsole::Shutdown()
{
#if BUILD_WITH_IMGUI
    if (m_impl != nullptr)
    {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();

        delete m_impl;
        m_impl = nullptr;
    }
#endif
}

void DeveloperConsole::BeginFrame()
{
#if BUILD_WITH_IMGUI
    if (m_impl == nullptr)
    {
        return;
    }
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
#endif
}

void DeveloperConsole::Render(const ConsoleContext& context, float fps)
{
#if BUILD_WITH_IMGUI
    if (m_impl == nullptr)
    {
        return;
    }

    if (context.showDebugHud != nullptr && *context.showDebugHud)
    {
        m_impl->DrawDebugHud(context, fps);
    }

    if (m_impl->open)
    {
        if (!m_impl->firstOpenAnnouncementDone)
        {
            m_commands.AddLog("Type `help` to list commands.");
            m_impl->firstOpenAnnouncementDone = true;
        }

        ImGui::SetNextWindowSize(ImVec2(620.0F, 320.0F), ImGuiCond_FirstUseEver);
        if (ImGui::Begin("Developer Console", &m_impl->open))
        {
            if (ImGui::Button("Clear"))
            {
                m_commands.ClearLog();
            }
            ImGui::SameLine();
            ImGui::TextUnformatted("Examples: difficulty crazy | set_failures 2 | events 10");

            ImGui::Separator();
            ImGui::BeginChild("ScrollingRegion", ImVec2(0, -ImGui::GetFrameHeightWithSpacing() * 2.0F), false, ImGuiWindowFlags_HorizontalScrollbar);
            for (const std::string& item : m_commands.Items())
            {
                ImGui::TextUnformatted(item.c_str());
            }
            if (m_commands.scrollToBottom)
            {
                ImGui::SetScrollHereY(1.0F);
                m_commands.scrollToBottom = false;
            }
            ImGui::EndChild();

            const ImGuiInputTextFlags inputFlags = ImGuiInputTextFlags_EnterReturnsTrue |
                                                   ImGuiInputTextFlags_CallbackCompletion |
                                                   ImGuiInputTextFlags_CallbackHistory;
            if (ImGui::InputText(
                    "Input",
                    m_impl->inputBuffer.data(),
                    m_impl->inputBuffer.size(),
                    inputFlags,
                    &Impl::TextEditCallbackStub,
                    m_impl))
            {
                const std::string command = m_impl->inputBuffer.data();
                if (!command.empty())
                {
                    m_commands.Execute(command, context);
                    m_impl->historyPos = -1;
                }
                m_impl->inputBuffer.fill('\0');
                m_impl->reclaimFocus = true;
            }

            const std::string currentInput = m_impl->inputBuffer.data();
            if (!currentInput.empty())
            {
                const std::vector<ConsoleCommands::CommandInfo> hints = m_commands.BuildHints(currentInput);
                const int maxHints = std::min<int>(4, static_cast<int>(hints.size()));
                for (int i = 0; i < maxHints; ++i)
                {
                    const auto& hint = hints[static_cast<std::size_t>(i)];
                    ImGui::Text("  [%s] %s - %s", hint.category.c_str(), hint.usage.c_str(), hint.description.c_str());
                }
            }

            if (m_impl->reclaimFocus)
            {
                ImGui::SetKeyboardFocusHere(-1);
                m_impl->reclaimFocus = false;
            }
        }
        ImGui::End();
    }

    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
#else
    (void)context;
    (void)fps;
#endif
}

void DeveloperConsole::Toggle()
{
#if BUILD_WITH_IMGUI
    if (m_impl != nullptr)
    {
        const bool wasOpen = m_impl->open;
        m_impl->open = !m_impl->open;
        if (!wasOpen && m_impl->open)
        {
            m_impl->reclaimFocus = true;
        }
    }
#endif
}

bool DeveloperConsole::IsOpen() const
{
#if BUILD_WITH_IMGUI
    return m_impl != nullptr && m_impl->open;
#else
    return false;
#endif
}

bool DeveloperConsole::WantsKeyboardCapture() const
{
#if BUILD_WITH_IMGUI
    if (m_impl == nullptr)
    {
        return false;
    }
    return m_impl->open && ImGui::GetIO().WantCaptureKeyboard;
#else
    return false;
#endif
}
} // namespace ui
