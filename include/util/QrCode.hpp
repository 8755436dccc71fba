#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lanlink::util {

// Module matrix of an encoded symbol, row-major, true = dark.
struct QrMatrix {
  int width{0};
  std::vector<bool> modules;

  [[nodiscard]] bool dark(int x, int y) const { return modules[static_cast<size_t>(y) * width + x]; }
};

// Byte-mode encoding at error-correction level M via libqrencode.
[[nodiscard]] std::optional<QrMatrix> qr_encode(std::string_view text);

// Standalone SVG; each module is `scale` user units and the quiet zone is
// `margin` modules wide.
[[nodiscard]] std::string qr_to_svg(const QrMatrix& qr, int scale = 8, int margin = 4);

// qr_encode + qr_to_svg.
[[nodiscard]] std::optional<std::string> qr_svg(std::string_view text);

} // namespace lanlink::util
