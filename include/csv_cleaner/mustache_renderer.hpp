#pragma once
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace cc {

// Template data: scalar tags, list sections, and raw JSON for {{{ctx}}}.
struct RenderContext {
  using Item = std::map<std::string, std::string>;
  std::map<std::string, std::string> values;
  std::map<std::string, std::vector<Item>> lists;
  std::string ctx_json;
};

class MustacheRenderer {
public:
  struct Config {
    std::string template_dir = "templates";
    std::string partials_dir = "templates/partials";
    std::vector<std::string> static_css = {"web/css/report.css"};
  };

  explicit MustacheRenderer(Config cfg);

  bool render_to_string(std::string_view template_name,
                        const RenderContext& ctx,
                        std::string& out);

  bool render_to_file(std::string_view template_name,
                      const RenderContext& ctx,
                      std::string_view out_path);

  // Render into out_dir/out_name; stylesheet copy failures are non-fatal.
  bool render_to_dir(std::string_view template_name,
                     const RenderContext& ctx,
                     std::string_view out_dir,
                     std::string_view out_name,
                     bool copy_assets);

  const std::string& last_error() const noexcept { return err_; }

private:
  Config cfg_;
  std::string err_;
};

}
