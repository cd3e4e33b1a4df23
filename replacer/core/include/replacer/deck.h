#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace replacer {

  // Character attributes of a run. Copied as a whole and compared by value; the
  // replacement engine never looks inside.
  class formatting {
  public:
    using attributes = std::map<std::string, std::string>;

    formatting() = default;
    explicit formatting(attributes values) : values_(std::move(values)) {
    }

    auto values() const noexcept -> attributes const& {
      return values_;
    }

    auto empty() const noexcept -> bool {
      return values_.empty();
    }

    friend auto operator==(formatting const& lhs, formatting const& rhs) -> bool {
      return lhs.values_ == rhs.values_;
    }

    friend auto operator!=(formatting const& lhs, formatting const& rhs) -> bool {
      return not(lhs == rhs);
    }

  private:
    attributes values_;
  };

  struct run {
    std::string          text;
    replacer::formatting format;

    friend auto operator==(run const& lhs, run const& rhs) -> bool {
      return lhs.text == rhs.text and lhs.format == rhs.format;
    }

    friend auto operator!=(run const& lhs, run const& rhs) -> bool {
      return not(lhs == rhs);
    }
  };

  using runs = std::vector<run>;

  class paragraph {
  public:
    paragraph() = default;
    explicit paragraph(replacer::runs runs) : runs_(std::move(runs)) {
    }

    auto runs() const noexcept -> replacer::runs const& {
      return runs_;
    }

    void set_runs(replacer::runs runs) {
      runs_ = std::move(runs);
    }

    // Concatenated run texts.
    auto text() const -> std::string;

  private:
    replacer::runs runs_;
  };

  struct shape {
    std::string            name;
    std::vector<paragraph> paragraphs;
  };

  class slide {
  public:
    slide() = default;
    explicit slide(std::vector<shape> shapes) : shapes_(std::move(shapes)) {
    }

    auto shapes() noexcept -> std::vector<shape>& {
      return shapes_;
    }

    auto shapes() const noexcept -> std::vector<shape> const& {
      return shapes_;
    }

    // Paragraphs of all text-bearing shapes, shape by shape.
    auto paragraphs() -> std::vector<paragraph*>;
    auto paragraphs() const -> std::vector<paragraph const*>;

  private:
    std::vector<shape> shapes_;
  };

  struct deck {
    std::vector<slide> slides;

    // 1-based index of the current slide.
    std::optional<std::size_t> cursor;

    auto slide_count() const noexcept -> std::size_t {
      return slides.size();
    }
  };
} // namespace replacer
