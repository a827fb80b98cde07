#ifdef WITH_GUI
#include "zipmaker/conf.hpp"
#include "zipmaker/Logger.hpp"
#include "zipmaker/Window.hpp"

#include <array>
#include <iostream>

#include <imgui.h>
#include <misc/cpp/imgui_stdlib.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>
#include <glad/glad.h>
#include <GLFW/glfw3.h>

Window::Window(const std::shared_ptr<Logger>& logger_, const std::vector<std::string>& initial_files) : logger(logger_), job(logger_)
{
    selected_method = 0;
    open_popup = false;
    was_running = false;

    {
        std::shared_lock<std::shared_mutex> lock(Conf::conf_mutex);
        const ProtocolCraft::Json::Value conf = Conf::LoadConf();
        if (conf[Conf::output_path_key].is_string())
        {
            output_path = conf[Conf::output_path_key].get_string();
        }
        if (conf[Conf::compression_method_key].is_string())
        {
            try
            {
                selected_method = static_cast<int>(ChoiceFromString(conf[Conf::compression_method_key].get_string()));
            }
            catch (const std::runtime_error& e)
            {
                logger->Warning(std::string(e.what()) + ", using auto");
            }
        }
    }

    for (const std::string& f : initial_files)
    {
        AddFile(f);
    }
}

Window::~Window()
{
    job.Cancel();
    job.Wait();
}

void Window::Render()
{
    glfwInit();
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#endif

    glfwWindowHint(GLFW_RESIZABLE, GL_FALSE);
    GLFWwindow* window = glfwCreateWindow(800, 600, "ZipMaker", NULL, NULL);
    if (window == NULL)
    {
        std::cerr << "Failed to create GLFW window" << std::endl;
        glfwTerminate();
        return;
    }

    glfwSetWindowUserPointer(window, this);
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);
    glfwSetInputMode(window, GLFW_CURSOR, GLFW_CURSOR_NORMAL);
    glfwSetDropCallback(window, [](GLFWwindow* w, int count, const char** paths)
        {
            Window* zip_window = static_cast<Window*>(glfwGetWindowUserPointer(w));
            if (zip_window->job.IsRunning())
            {
                return;
            }
            for (int i = 0; i < count; ++i)
            {
                zip_window->AddFile(paths[i]);
            }
        });

    // glad: load all OpenGL function pointers
    // ---------------------------------------
    if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress))
    {
        std::cerr << "Failed to initialize GLAD" << std::endl;
        glfwDestroyWindow(window);
        glfwTerminate();
        return;
    }

    // imgui: setup context
    // ---------------------------------------
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();

    // Style
    ImGui::StyleColorsDark();
    ImGui::GetIO().IniFilename = NULL;
    ImGui::GetIO().LogFilename = NULL;

    // Setup platform/renderer
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init("#version 330");

    InternalRenderLoop(window);

    // ImGui cleaning
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
}

void HelpMarker(const char* tooltip);

void Window::InternalRenderLoop(GLFWwindow* window)
{
    int width, height;
    glfwGetWindowSize(window, &width, &height);

    const std::array<const char*, 5> method_names = {
        "Automatic",
        "Deflate",
        "Bzip2",
        "LZMA",
        "Store only"
    };
    const std::array<const char*, 5> method_tooltips = {
        "Pick a method per file based on its content: already compressed files are stored, "
        "small or low entropy files are deflated, medium entropy files use bzip2 and high entropy files use lzma",
        "Deflate, best of levels 1, 6 and 9",
        "Bzip2, 900k blocks",
        "LZMA, preset 9",
        "No compression"
    };

    while (glfwWindowShouldClose(window) == 0)
    {
        // clear the window
        glClear(GL_COLOR_BUFFER_BIT);

        // Init imgui frame
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        const bool running = job.IsRunning();
        // Job just finished, display the result
        if (was_running && !running)
        {
            switch (job.GetState())
            {
            case JobState::Succeeded:
                ShowMessage("Success", job.GetStatus());
                break;
            case JobState::Failed:
                ShowMessage("Error", "Error creating zip file: " + job.GetStatus().substr(std::string("Error: ").size()));
                break;
            case JobState::Cancelled:
                ShowMessage("Warning", "Zip file creation cancelled");
                break;
            default:
                break;
            }
        }
        was_running = running;

        {
            ImGui::SetNextWindowPos(ImVec2(0, 0));
            ImGui::SetNextWindowSize(ImVec2(static_cast<float>(width), static_cast<float>(height)));

            ImGui::Begin("ZipMaker Main Window", NULL,
                ImGuiWindowFlags_NoResize |
                ImGuiWindowFlags_NoMove |
                ImGuiWindowFlags_NoCollapse |
                ImGuiWindowFlags_NoSavedSettings |
                ImGuiWindowFlags_NoTitleBar |
                ImGuiWindowFlags_NoScrollbar |
                ImGuiWindowFlags_NoScrollWithMouse
            );

            ImGui::SeparatorText("File selection");
            {
                ImGui::BeginDisabled(running);
                ImGui::SetNextItemWidth(ImGui::GetContentRegionAvail().x - 250.0f);
                const bool enter_pressed = ImGui::InputTextWithHint("##add_path", "Path of a file to add (or drop files on the window)", &add_path, ImGuiInputTextFlags_EnterReturnsTrue);
                ImGui::SameLine();
                if (ImGui::Button("Add file") || enter_pressed)
                {
                    if (!add_path.empty())
                    {
                        AddFile(add_path);
                        add_path.clear();
                    }
                }
                ImGui::SameLine();
                if (ImGui::Button("Remove selected"))
                {
                    std::scoped_lock<std::mutex> lock(files_mutex);
                    // Remove from the end so indices stay valid
                    for (auto it = selected_files.rbegin(); it != selected_files.rend(); ++it)
                    {
                        files.Remove(*it);
                    }
                    selected_files.clear();
                }
                ImGui::SameLine();
                if (ImGui::Button("Clear files"))
                {
                    std::scoped_lock<std::mutex> lock(files_mutex);
                    files.Clear();
                    selected_files.clear();
                }
                ImGui::EndDisabled();
            }

            ImGui::SeparatorText("Compression settings");
            {
                ImGui::BeginDisabled(running);
                for (int i = 0; i < static_cast<int>(method_names.size()); ++i)
                {
                    if (i > 0)
                    {
                        ImGui::SameLine(0.0f, 20.0f);
                    }
                    if (ImGui::RadioButton(method_names[i], &selected_method, i))
                    {
                        SaveConfValue(Conf::compression_method_key, std::string(ChoiceToString(static_cast<CompressionChoice>(selected_method))));
                    }
                    ImGui::SameLine();
                    HelpMarker(method_tooltips[i]);
                }
                ImGui::EndDisabled();
            }

            ImGui::SeparatorText("Selected files");
            {
                std::scoped_lock<std::mutex> lock(files_mutex);
                const float table_height = ImGui::GetContentRegionAvail().y - 6 * ImGui::GetFrameHeightWithSpacing();
                if (ImGui::BeginTable("##files", 2, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg | ImGuiTableFlags_ScrollY, ImVec2(0.0f, table_height)))
                {
                    ImGui::TableSetupScrollFreeze(0, 1);
                    ImGui::TableSetupColumn("Size", ImGuiTableColumnFlags_WidthFixed, 100.0f);
                    ImGui::TableSetupColumn("File path", ImGuiTableColumnFlags_WidthStretch);
                    ImGui::TableHeadersRow();

                    const std::vector<FileListItem>& items = files.Items();
                    for (size_t i = 0; i < items.size(); ++i)
                    {
                        ImGui::TableNextRow();
                        ImGui::TableSetColumnIndex(0);
                        const bool is_selected = selected_files.find(i) != selected_files.end();
                        ImGui::PushID(static_cast<int>(i));
                        if (ImGui::Selectable(FormatSize(items[i].size).c_str(), is_selected, ImGuiSelectableFlags_SpanAllColumns))
                        {
                            // Ctrl+click for multiple selection
                            if (!ImGui::GetIO().KeyCtrl)
                            {
                                selected_files.clear();
                                selected_files.insert(i);
                            }
                            else if (is_selected)
                            {
                                selected_files.erase(i);
                            }
                            else
                            {
                                selected_files.insert(i);
                            }
                        }
                        ImGui::PopID();
                        ImGui::TableSetColumnIndex(1);
                        ImGui::TextUnformatted(items[i].path.string().c_str());
                    }
                    ImGui::EndTable();
                }
                ImGui::Text("%zu file(s), %s", files.Size(), FormatSize(files.TotalSize()).c_str());
            }

            ImGui::SeparatorText("Progress");
            {
                ImGui::ProgressBar(job.GetProgress() / 100.0f, ImVec2(-1.0f, 0.0f));
                ImGui::TextUnformatted(job.GetStatus().c_str());
            }

            ImGui::Separator();
            {
                ImGui::BeginDisabled(running);
                ImGui::TextUnformatted("Output file");
                ImGui::SameLine();
                ImGui::SetNextItemWidth(ImGui::GetContentRegionAvail().x);
                ImGui::InputTextWithHint("##output_path", "Path of the zip file to create", &output_path);
                if (ImGui::IsItemDeactivatedAfterEdit())
                {
                    SaveConfValue(Conf::output_path_key, output_path);
                }
                ImGui::EndDisabled();

                if (!running)
                {
                    ImGui::PushStyleColor(ImGuiCol_::ImGuiCol_Button, ImVec4(0.0f, 0.5f, 0.0f, 1.0f));
                    if (ImGui::Button("Create zip file", ImVec2(-1.0f, 0.0f)))
                    {
                        CreateZip();
                    }
                    ImGui::PopStyleColor();
                }
                else
                {
                    if (ImGui::Button("Cancel", ImVec2(-1.0f, 0.0f)))
                    {
                        job.Cancel();
                    }
                }
            }

            if (open_popup)
            {
                ImGui::OpenPopup("##message_popup");
                open_popup = false;
            }
            if (ImGui::BeginPopupModal("##message_popup", NULL, ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoTitleBar))
            {
                ImGui::SeparatorText(popup_title.c_str());
                ImGui::TextUnformatted(popup_message.c_str());
                if (ImGui::Button("OK", ImVec2(120.0f, 0.0f)))
                {
                    ImGui::CloseCurrentPopup();
                }
                ImGui::EndPopup();
            }

            ImGui::End();
        }

        // Render ImGui
        ImGui::Render();
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        // swap buffer
        glfwSwapBuffers(window);

        // process user events
        glfwPollEvents();
    }
}

void Window::AddFile(const std::string& path)
{
    std::string error;
    bool added = false;
    {
        std::scoped_lock<std::mutex> lock(files_mutex);
        added = files.Add(path, error);
    }
    if (!added)
    {
        logger->Warning("Can't add file: " + error);
    }
}

void Window::CreateZip()
{
    ArchiveRequest request;
    {
        std::scoped_lock<std::mutex> lock(files_mutex);
        request.files = files.Items();
    }
    if (request.files.empty())
    {
        ShowMessage("Warning", "No files selected!");
        return;
    }
    if (output_path.empty())
    {
        ShowMessage("Warning", "No output file selected!");
        return;
    }

    std::filesystem::path output(output_path);
    if (!output.has_extension())
    {
        output.replace_extension(".zip");
    }
    request.output_path = output;
    request.choice = static_cast<CompressionChoice>(selected_method);

    try
    {
        std::shared_lock<std::shared_mutex> lock(Conf::conf_mutex);
        const ProtocolCraft::Json::Value conf = Conf::LoadConf();
        request.settings = Conf::GetEncoderSettings(conf);
        request.verify = Conf::GetBool(conf, Conf::verify_archive_key);
    }
    catch (const std::runtime_error& e)
    {
        logger->Warning(std::string("Can't load settings, using defaults: ") + e.what());
    }
    logger->LoadConfig();

    std::string error;
    if (!job.Start(request, error))
    {
        ShowMessage("Warning", error);
    }
}

void Window::SaveConfValue(const std::string& key, const std::string& value)
{
    try
    {
        std::scoped_lock<std::shared_mutex> lock(Conf::conf_mutex);
        ProtocolCraft::Json::Value conf = Conf::LoadConf();
        conf[key] = value;
        Conf::SaveConf(conf);
    }
    catch (const std::runtime_error& e)
    {
        logger->Error(std::string("Can't save settings: ") + e.what());
        ShowMessage("Error", std::string("Can't save settings: ") + e.what());
    }
}

void Window::ShowMessage(const std::string& title, const std::string& message)
{
    popup_title = title;
    popup_message = message;
    open_popup = true;
}

void HelpMarker(const char* tooltip)
{
    ImGui::TextDisabled("(?)");
    if (ImGui::IsItemHovered(ImGuiHoveredFlags_AllowWhenDisabled) && ImGui::BeginTooltip())
    {
        ImGui::PushTextWrapPos(ImGui::GetFontSize() * 35.0f);
        ImGui::TextUnformatted(tooltip);
        ImGui::PopTextWrapPos();
        ImGui::EndTooltip();
    }
}
#endif
