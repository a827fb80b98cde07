#pragma once

#ifdef WITH_GUI
#include "zipmaker/ArchiveJob.hpp"
#include "zipmaker/FileList.hpp"

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

struct GLFWwindow;
class Logger;

class Window
{
public:
    Window(const std::shared_ptr<Logger>& logger, const std::vector<std::string>& initial_files);
    ~Window();
    void Render();

private:
    void InternalRenderLoop(GLFWwindow* window);
    void AddFile(const std::string& path);
    void CreateZip();
    /// @brief Write a value to the conf file, errors are reported without stopping the window
    void SaveConfValue(const std::string& key, const std::string& value);
    void ShowMessage(const std::string& title, const std::string& message);

private:
    std::shared_ptr<Logger> logger;
    ArchiveJob job;

    /// @brief Protect files, can be modified by the drop callback
    std::mutex files_mutex;
    FileList files;
    std::set<size_t> selected_files;

    std::string add_path;
    std::string output_path;
    int selected_method;

    std::string popup_title;
    std::string popup_message;
    bool open_popup;
    bool was_running;
};
#endif
