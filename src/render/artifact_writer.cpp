#include "csv_cleaner/artifact_writer.hpp"
#include "csv_cleaner/path_utils.hpp"
#include <filesystem>
#include <fstream>

namespace cc {

bool write_text_file(const std::string& path, const std::string& text, std::string* err_out) {
  if (!ensure_parent_dirs(std::filesystem::path(path))) {
    if (err_out) *err_out = "cannot create parent directory of " + path;
    return false;
  }
  std::ofstream out(path, std::ios::binary);
  if (out) out.write(text.data(), static_cast<std::streamsize>(text.size()));
  if (!out) {
    if (err_out) *err_out = "failed to write " + path;
    return false;
  }
  return true;
}

bool write_report_dir(const std::string& artifact_root,
                      const std::string& slug,
                      const ReportArtifacts& artifacts,
                      std::string* err_out) {
  const std::filesystem::path out_dir =
      std::filesystem::path(artifact_root) / slug;

  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    if (err_out) *err_out = "cannot create " + out_dir.string() + ": " + ec.message();
    return false;
  }

  if (!write_text_file((out_dir / artifacts.output_name).string(), artifacts.cleaned_csv, err_out))
    return false;
  if (!write_text_file((out_dir / "run.json").string(), artifacts.run_json, err_out))
    return false;

  MustacheRenderer::Config rcfg;
#ifdef CC_DEFAULT_TEMPLATE_DIR
  rcfg.template_dir = CC_DEFAULT_TEMPLATE_DIR;
#else
  rcfg.template_dir = "templates";
#endif
  rcfg.partials_dir = rcfg.template_dir + "/partials";

  MustacheRenderer renderer(rcfg);
  const bool ok = renderer.render_to_dir("report.mustache",
                                         artifacts.view,
                                         out_dir.string(),
                                         "report.html",
                                         /*copy_assets=*/true);
  if (!ok && err_out) *err_out = renderer.last_error();
  return ok;
}

}
