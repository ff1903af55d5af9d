// Ticket: 0001_two_particle_core

#ifndef TPMD_SIM_VEC2_FORMATTER_BASE_HPP
#define TPMD_SIM_VEC2_FORMATTER_BASE_HPP

#include <string>

#include <fmt/format.h>

namespace tpmd_sim::detail
{

/// Shared fmt formatter base for 2-component vector types.
/// Provides parse() for [width][.precision][type] format specs
/// and formatComponents() to emit "(c0, c1)" output.
template <typename T>
struct Vec2FormatterBase
{
  char presentation = 'f';
  int precision = 6;
  int width = 0;

  constexpr auto parse(fmt::format_parse_context& ctx)
  {
    auto it = ctx.begin();
    auto end = ctx.end();

    if (it == end || *it == '}')
    {
      return it;
    }

    // Parse optional width
    if (it != end && *it >= '0' && *it <= '9')
    {
      width = 0;
      while (it != end && *it >= '0' && *it <= '9')
      {
        width = width * 10 + (*it - '0');
        ++it;
      }
    }

    // Parse optional precision
    if (it != end && *it == '.')
    {
      ++it;
      precision = 0;
      while (it != end && *it >= '0' && *it <= '9')
      {
        precision = precision * 10 + (*it - '0');
        ++it;
      }
    }

    // Parse optional presentation type
    if (it != end && (*it == 'f' || *it == 'e' || *it == 'g'))
    {
      presentation = *it;
      ++it;
    }

    return it;
  }

protected:
  template <typename FormatContext>
  auto formatComponents(const T& vec, FormatContext& ctx) const
  {
    return fmt::format_to(ctx.out(),
                          "({}, {})",
                          formatComponent(vec.x()),
                          formatComponent(vec.y()));
  }

private:
  std::string formatComponent(double value) const
  {
    switch (presentation)
    {
      case 'e':
        return fmt::format("{:{}.{}e}", value, width, precision);
      case 'g':
        return fmt::format("{:{}.{}g}", value, width, precision);
      default:
        return fmt::format("{:{}.{}f}", value, width, precision);
    }
  }
};

}  // namespace tpmd_sim::detail

#endif  // TPMD_SIM_VEC2_FORMATTER_BASE_HPP
