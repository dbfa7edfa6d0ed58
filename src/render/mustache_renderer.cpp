#include "csv_cleaner/mustache_renderer.hpp"
#include "csv_cleaner/path_utils.hpp"

#include <kainjow/mustache.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace cc {

MustacheRenderer::MustacheRenderer(Config cfg) : cfg_(std::move(cfg)) {}

static bool read_file(const std::filesystem::path& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss; ss << in.rdbuf();
  out = ss.str();
  return true;
}

static std::string_view trim_tag(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

// Replaces each "{{> name}}" with partials_dir/name[.mustache]. One level
// only; a missing partial leaves its tag in place and is noted in `err`.
static std::string inline_partials(const std::string& tpl,
                                   const std::filesystem::path& partials_dir,
                                   std::string& err) {
  std::string out;
  out.reserve(tpl.size());
  std::size_t from = 0;
  while (true) {
    const std::size_t open = tpl.find("{{>", from);
    const std::size_t close = open == std::string::npos ? open : tpl.find("}}", open);
    if (close == std::string::npos) { out.append(tpl, from, std::string::npos); break; }

    out.append(tpl, from, open - from);
    const std::string name(trim_tag(std::string_view(tpl).substr(open + 3, close - open - 3)));
    std::string body;
    if (!name.empty() &&
        (read_file(partials_dir / (name + ".mustache"), body) || read_file(partials_dir / name, body))) {
      out += body;
    } else {
      err += "partial not found: " + name + "\n";
      out.append(tpl, open, close + 2 - open);
    }
    from = close + 2;
  }
  return out;
}

// Looks for `rel` under the working directory first, then under the
// installed static dir.
static bool copy_asset(const std::string& rel,
                       const std::filesystem::path& out_dir,
                       std::string& err) {
  std::error_code ec;
  std::filesystem::path src(rel);
#ifdef CC_DEFAULT_STATIC_DIR
  if (!std::filesystem::exists(src, ec)) src = std::filesystem::path(CC_DEFAULT_STATIC_DIR) / src.filename();
#endif
  if (!std::filesystem::exists(src, ec)) {
    err += "asset not found: " + rel + "\n";
    return false;
  }
  const auto dst = out_dir / src.filename();
  if (!std::filesystem::copy_file(src, dst, std::filesystem::copy_options::overwrite_existing, ec) && ec) {
    err += "copy " + src.string() + ": " + ec.message() + "\n";
    return false;
  }
  return true;
}

static kainjow::mustache::data to_data(const RenderContext& ctx) {
  kainjow::mustache::data d;
  for (const auto& kv : ctx.values) d.set(kv.first, kv.second);
  for (const auto& section : ctx.lists) {
    kainjow::mustache::list items;
    for (const auto& item : section.second) {
      kainjow::mustache::data obj;
      for (const auto& kv : item) obj.set(kv.first, kv.second);
      items.push_back(obj);
    }
    d.set(section.first, kainjow::mustache::data{items});
  }
  d.set("ctx", ctx.ctx_json);
  return d;
}

bool MustacheRenderer::render_to_string(std::string_view template_name,
                                        const RenderContext& ctx,
                                        std::string& out) {
  err_.clear();
  const auto tpl_path = std::filesystem::path(cfg_.template_dir) / std::string(template_name);

  std::string tpl;
  if (!read_file(tpl_path, tpl)) { err_ = "open failed: " + tpl_path.string(); return false; }
  tpl = inline_partials(tpl, std::filesystem::path(cfg_.partials_dir), err_);

  kainjow::mustache::mustache view(tpl);
  if (!view.is_valid()) { err_ = view.error_message(); return false; }

  out = view.render(to_data(ctx));
  if (!view.is_valid()) { err_ = view.error_message(); return false; }
  return true;
}

bool MustacheRenderer::render_to_file(std::string_view template_name,
                                      const RenderContext& ctx,
                                      std::string_view out_path) {
  std::string rendered;
  if (!render_to_string(template_name, ctx, rendered)) return false;

  if (!ensure_parent_dirs(std::filesystem::path(std::string(out_path)))) {
    err_ = "mkdir -p failed: " + std::string(out_path);
    return false;
  }
  std::ofstream out(std::string(out_path), std::ios::binary);
  if (!out) { err_ = "write failed: " + std::string(out_path); return false; }
  out.write(rendered.data(), static_cast<std::streamsize>(rendered.size()));
  return static_cast<bool>(out);
}

bool MustacheRenderer::render_to_dir(std::string_view template_name,
                                     const RenderContext& ctx,
                                     std::string_view out_dir,
                                     std::string_view out_name,
                                     bool copy_assets) {
  const std::filesystem::path outdir{std::string(out_dir)};
  const std::filesystem::path outpath = outdir / std::string(out_name);

  if (!render_to_file(template_name, ctx, outpath.string())) return false;
  if (!copy_assets) return true;

  for (const auto& css : cfg_.static_css) {
    if (!copy_asset(css, outdir, err_)) std::cerr << "[render] " << err_;
  }
  return true; // non-fatal if the stylesheet is missing
}

}
