#pragma once

#include "gcsg.hpp"

#include <iterator>
#include <variant>
#include <vector>

namespace gcsg::geometry
{
  // Lazy view over the sample points of a primitive. Points are computed on dereference, so the
  // range can be walked any number of times and always yields the same sequence.
  template <typename P>
  class sample_range final
  {
    const P * __restrict primitive_;

  public:
    class iterator final
    {
      const P * __restrict primitive_;
      usize index_;

    public:
      using iterator_category = std::input_iterator_tag;
      using value_type = vector3<>;
      using difference_type = ssize;
      using pointer = const vector3<> *;
      using reference = vector3<>;

      iterator(const P * __restrict primitive, usize index) : primitive_(primitive), index_(index) {}

      vector3<> operator * () const __restrict { return primitive_->sample(index_); }

      iterator & operator ++ () __restrict
      {
        ++index_;
        return *this;
      }

      iterator operator ++ (int) __restrict
      {
        iterator out = *this;
        ++index_;
        return out;
      }

      bool operator == (const iterator & __restrict other) const __restrict { return index_ == other.index_; }
      bool operator != (const iterator & __restrict other) const __restrict { return index_ != other.index_; }
    };

    explicit sample_range(const P & __restrict primitive) : primitive_(&primitive) {}

    iterator begin() const __restrict { return { primitive_, 0 }; }
    iterator end() const __restrict { return { primitive_, primitive_->sample_count() }; }
    usize size() const __restrict { return primitive_->sample_count(); }
  };

  // Straight segment between two points, optionally subdivided into equal pieces.
  class segment final
  {
    vector3<> start_;
    vector3<> end_;
    uint subdivisions_;

  public:
    segment(const vector3<> & __restrict start, const vector3<> & __restrict end, uint subdivisions = 1);

    const vector3<> & start_point() const __restrict { return start_; }
    const vector3<> & end_point() const __restrict { return end_; }
    uint subdivisions() const __restrict { return subdivisions_; }

    real length() const __restrict { return start_.distance(end_); }

    // A zero-length segment collapses to its start point.
    bool is_degenerate() const __restrict { return start_ == end_; }

    usize sample_count() const __restrict;
    vector3<> sample(usize index) const __restrict;
  };

  // Circular arc in the XY plane at the center's Z. Angles are radians; a positive sweep runs counter-clockwise.
  class arc final
  {
    vector3<> center_;
    real radius_;
    real start_angle_;
    real sweep_;
    uint segments_;

    arc(const vector3<> & __restrict center, real radius, real start_angle, real sweep, uint segments);

  public:
    // Fixed angular step: the sweep is split into `segments` equal pieces.
    static arc with_segments(const vector3<> & __restrict center, real radius, real start_angle, real sweep, uint segments);
    // Smallest segment count whose chords stay within `tolerance` of the true arc.
    static arc with_tolerance(const vector3<> & __restrict center, real radius, real start_angle, real sweep, real tolerance);

    const vector3<> & center() const __restrict { return center_; }
    real radius() const __restrict { return radius_; }
    real start_angle() const __restrict { return start_angle_; }
    real sweep() const __restrict { return sweep_; }
    uint segments() const __restrict { return segments_; }

    bool is_clockwise() const __restrict { return sweep_ < 0.0; }
    bool is_full_circle() const __restrict;
    bool is_degenerate() const __restrict { return sweep_ == 0.0; }

    real length() const __restrict { return std::abs(sweep_) * radius_; }

    vector3<> point_at(real angle) const __restrict;
    vector3<> start_point() const __restrict { return point_at(start_angle_); }
    vector3<> end_point() const __restrict;

    usize sample_count() const __restrict;
    vector3<> sample(usize index) const __restrict;
  };

  using primitive = std::variant<segment, arc>;
  using path = std::vector<primitive>;

  template <typename P>
  sample_range<P> samples(const P & __restrict p)
  {
    return sample_range<P>{ p };
  }

  // Upper bound on the pieces a single primitive is split into.
  static constexpr const uint max_segments = 10000000;

  // N = ceil(|sweep| / (2 * acos(1 - tolerance / radius))), at least 1.
  extern uint segments_for_tolerance(real sweep, real radius, real tolerance);

  extern vector3<> start_point(const primitive & __restrict p);
  extern vector3<> end_point(const primitive & __restrict p);
  extern real length(const primitive & __restrict p);

  // Unit XY direction of travel where the primitive starts / ends. Zero when it has no extent in XY.
  extern vector3<> start_direction(const primitive & __restrict p);
  extern vector3<> end_direction(const primitive & __restrict p);
}
