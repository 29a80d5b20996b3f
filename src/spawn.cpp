#include <crazycar/spawn.hpp>
#include <crazycar/log.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace crazycar {

static long long color_dist2(Rgba a, Rgba b) {
  const long long dr = int(a.r) - int(b.r);
  const long long dg = int(a.g) - int(b.g);
  const long long db = int(a.b) - int(b.b);
  return dr * dr + dg * dg + db * db;
}

std::vector<Pixel> collect_color_pixels(const ColorMap& map, Rgba target, int tolerance, int step) {
  std::vector<Pixel> out;
  if (step <= 0) step = 1;
  const long long tol2 = static_cast<long long>(tolerance) * tolerance;
  for (int y = 0; y < map.height(); y += step) {
    for (int x = 0; x < map.width(); x += step) {
      if (color_dist2(map.color_at(x, y), target) <= tol2) out.push_back(Pixel{x, y});
    }
  }
  return out;
}

static long long key_of(Pixel p) {
  return (static_cast<long long>(p.y) << 32) ^ static_cast<unsigned int>(p.x);
}

std::vector<Pixel> largest_component(const std::vector<Pixel>& pixels, int step) {
  if (step <= 0) step = 1;
  std::unordered_set<long long> remaining;
  remaining.reserve(pixels.size() * 2);
  for (const auto& p : pixels) remaining.insert(key_of(p));

  std::vector<Pixel> best;
  std::vector<Pixel> queue;
  const Pixel neigh[4] = {{step, 0}, {-step, 0}, {0, step}, {0, -step}};

  // Seeds in input order so equal-sized components resolve deterministically.
  for (const auto& seed : pixels) {
    if (remaining.erase(key_of(seed)) == 0) continue;
    std::vector<Pixel> comp{seed};
    queue.assign(1, seed);
    while (!queue.empty()) {
      const Pixel p = queue.back();
      queue.pop_back();
      for (const auto& d : neigh) {
        const Pixel n{p.x + d.x, p.y + d.y};
        if (remaining.erase(key_of(n)) > 0) {
          queue.push_back(n);
          comp.push_back(n);
        }
      }
    }
    if (comp.size() > best.size()) best = std::move(comp);
  }
  return best;
}

Vec2 principal_direction(const std::vector<Pixel>& pixels, Vec2 mean) {
  if (pixels.empty()) return Vec2{1.0, 0.0};
  double sxx = 0.0, syy = 0.0, sxy = 0.0;
  for (const auto& p : pixels) {
    const double dx = p.x - mean.x;
    const double dy = p.y - mean.y;
    sxx += dx * dx;
    syy += dy * dy;
    sxy += dx * dy;
  }
  const double n = static_cast<double>(pixels.size());
  if (n > 1.0) {
    sxx /= (n - 1.0);
    syy /= (n - 1.0);
    sxy /= (n - 1.0);
  }
  const double trace = sxx + syy;
  const double det = sxx * syy - sxy * sxy;
  const double l1 = 0.5 * (trace + std::sqrt(std::max(0.0, trace * trace - 4.0 * det)));

  Vec2 v{sxy, l1 - sxx};
  if (std::abs(v.x) + std::abs(v.y) < 1e-12) {
    // Axis-aligned spread: pick the dominant axis.
    v = sxx >= syy ? Vec2{1.0, 0.0} : Vec2{0.0, 1.0};
  }
  const double len = length(v);
  return len > 0.0 ? v * (1.0 / len) : Vec2{1.0, 0.0};
}

int choose_side(const ColorMap& map, Vec2 origin, Vec2 dir, Rgba border, const FinishDetectParams& p) {
  const long long tol2 = static_cast<long long>(p.border_tolerance) * p.border_tolerance;
  const int step = p.side_sample_step > 0 ? p.side_sample_step : 1;
  auto score = [&](int sign) {
    double s = 0.0;
    for (int k = p.side_sample_start; k < p.side_sample_end; k += step) {
      const int x = trunc_px(origin.x + sign * dir.x * k);
      const int y = trunc_px(origin.y + sign * dir.y * k);
      if (!map.contains(x, y)) {
        s += 10.0;
        continue;
      }
      if (color_dist2(map.color_at(x, y), border) < tol2) s += 1.0;
    }
    return s;
  };
  const double s_pos = score(+1);
  const double s_neg = score(-1);
  log()->debug("spawn: side score +{:.1f} / -{:.1f}", s_pos, s_neg);
  return s_pos <= s_neg ? +1 : -1;
}

std::optional<FinishLineInfo> detect_finish_line(const ColorMap& map,
                                                 int cover_px,
                                                 const FinishDetectParams& p,
                                                 Rgba finish,
                                                 Rgba border) {
  const auto raw = collect_color_pixels(map, finish, p.tolerance, p.scan_step);
  const auto line = largest_component(raw, p.scan_step);
  if (line.size() < std::max<std::size_t>(p.min_pixels, 1)) {
    log()->debug("spawn: {} finish pixel(s), need {}", line.size(), p.min_pixels);
    return std::nullopt;
  }

  Vec2 mean{};
  for (const auto& px : line) mean = mean + Vec2{double(px.x), double(px.y)};
  mean = mean * (1.0 / static_cast<double>(line.size()));

  const Vec2 t = principal_direction(line, mean);
  double tmin = std::numeric_limits<double>::infinity();
  double tmax = -tmin;
  for (const auto& px : line) {
    const double s = (px.x - mean.x) * t.x + (px.y - mean.y) * t.y;
    tmin = std::min(tmin, s);
    tmax = std::max(tmax, s);
  }

  FinishLineInfo info{};
  info.pixels = line.size();
  info.center = mean + t * (0.5 * (tmin + tmax));
  info.tangent = t;
  info.normal = Vec2{-t.y, t.x};
  info.sign = choose_side(map, info.center, info.normal, border, p);

  const double offset = std::max(20.0, 1.5 * static_cast<double>(cover_px > 0 ? cover_px : 32));
  const Vec2 dir = info.normal * static_cast<double>(info.sign);
  info.spawn.center = Vec2{std::trunc(info.center.x + dir.x * offset),
                           std::trunc(info.center.y + dir.y * offset)};
  info.spawn.heading = normalize_angle(360.0 - rad_to_deg(std::atan2(dir.y, dir.x)));

  log()->info("spawn: finish line n={} center=({:.1f},{:.1f}) -> spawn=({:.0f},{:.0f}) heading={:.1f}",
              info.pixels, info.center.x, info.center.y, info.spawn.center.x, info.spawn.center.y,
              info.spawn.heading);
  return info;
}

} // namespace crazycar
