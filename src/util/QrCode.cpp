#include "util/QrCode.hpp"

#include <qrencode.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace lanlink::util {

std::optional<QrMatrix> qr_encode(std::string_view text) {
  // libqrencode wants a NUL-terminated string.
  std::string s(text);
  QRcode* code = QRcode_encodeString8bit(s.c_str(), 0, QR_ECLEVEL_M);
  if (!code) {
    std::fprintf(stderr, "lanlink: qr: cannot encode %zu bytes: %s\n", s.size(), std::strerror(errno));
    return std::nullopt;
  }
  QrMatrix m;
  m.width = code->width;
  m.modules.resize(static_cast<size_t>(code->width) * code->width);
  for (size_t i = 0; i < m.modules.size(); ++i) m.modules[i] = (code->data[i] & 0x01) != 0;
  QRcode_free(code);
  return m;
}

std::string qr_to_svg(const QrMatrix& qr, int scale, int margin) {
  const int side = (qr.width + 2 * margin) * scale;
  std::string out;
  out.reserve(256 + static_cast<size_t>(qr.width) * qr.width * 6);
  out += "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  out += "<svg xmlns=\"http://www.w3.org/2000/svg\" version=\"1.1\" width=\"" + std::to_string(side) +
         "\" height=\"" + std::to_string(side) + "\" viewBox=\"0 0 " + std::to_string(qr.width + 2 * margin) + ' ' +
         std::to_string(qr.width + 2 * margin) + "\" shape-rendering=\"crispEdges\">\n";
  out += "<rect width=\"100%\" height=\"100%\" fill=\"#ffffff\"/>\n<path fill=\"#000000\" d=\"";
  // One horizontal run per path segment.
  for (int y = 0; y < qr.width; ++y) {
    int x = 0;
    while (x < qr.width) {
      if (!qr.dark(x, y)) {
        ++x;
        continue;
      }
      int start = x;
      while (x < qr.width && qr.dark(x, y)) ++x;
      out += 'M' + std::to_string(start + margin) + ' ' + std::to_string(y + margin) + 'h' +
             std::to_string(x - start) + "v1h-" + std::to_string(x - start) + 'z';
    }
  }
  out += "\"/>\n</svg>\n";
  return out;
}

std::optional<std::string> qr_svg(std::string_view text) {
  auto m = qr_encode(text);
  if (!m) return std::nullopt;
  return qr_to_svg(*m);
}

} // namespace lanlink::util
