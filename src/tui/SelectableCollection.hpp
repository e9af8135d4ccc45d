// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tui/InputEvent.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace modelmatch::tui
{

/// @brief Result of offering an input event to a SelectableCollection.
enum class CollectionAction : std::uint8_t
{
    None,    ///< Not a navigation key.
    Changed, ///< Navigation key consumed; the selection may have moved.
};

/// @brief An ordered list of items with at most one selected position.
///
/// Navigation wraps around at both ends. On an empty collection every navigation
/// call is a no-op, so a present selection always refers to an existing item.
/// Replacing the items drops the selection.
template <typename T>
class SelectableCollection
{
  public:
    SelectableCollection() = default;

    explicit SelectableCollection(std::vector<T> items): _items(std::move(items)) {}

    /// @brief Selects the following item, wrapping to the first. Selects the first if none is selected.
    void next()
    {
        if (_items.empty())
            return;
        if (!_selected || *_selected + 1 >= _items.size())
            _selected = 0;
        else
            ++*_selected;
    }

    /// @brief Selects the preceding item, wrapping to the last. Selects the first if none is selected.
    void previous()
    {
        if (_items.empty())
            return;
        if (!_selected)
            _selected = 0;
        else if (*_selected == 0)
            _selected = _items.size() - 1;
        else
            --*_selected;
    }

    void first()
    {
        if (!_items.empty())
            _selected = 0;
    }

    void last()
    {
        if (!_items.empty())
            _selected = _items.size() - 1;
    }

    /// @brief Selects the item at @p index; out-of-range indices are ignored.
    void select(std::size_t index)
    {
        if (index < _items.size())
            _selected = index;
    }

    void clearSelection() noexcept { _selected.reset(); }

    void clear()
    {
        _items.clear();
        _selected.reset();
    }

    /// @brief Replaces all items, keeping their order. Nothing is selected afterwards.
    void replaceAll(std::vector<T> items)
    {
        _items = std::move(items);
        _selected.reset();
    }

    /// @brief Maps Up, Down, Home and End to previous(), next(), first() and last().
    [[nodiscard]] auto processEvent(KeyEvent const& key) -> CollectionAction
    {
        if (key.modifiers != Modifier::None)
            return CollectionAction::None;

        switch (key.key)
        {
            case KeyCode::Up: previous(); return CollectionAction::Changed;
            case KeyCode::Down: next(); return CollectionAction::Changed;
            case KeyCode::Home: first(); return CollectionAction::Changed;
            case KeyCode::End: last(); return CollectionAction::Changed;
            default: return CollectionAction::None;
        }
    }

    [[nodiscard]] auto items() const noexcept -> std::vector<T> const& { return _items; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return _items.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return _items.empty(); }
    [[nodiscard]] auto selectedIndex() const noexcept -> std::optional<std::size_t> { return _selected; }

    /// @brief Returns the selected item, or nullopt if nothing is selected.
    [[nodiscard]] auto selectedItem() const noexcept -> std::optional<T const*>
    {
        if (!_selected)
            return std::nullopt;
        return &_items[*_selected];
    }

  private:
    std::vector<T> _items;
    std::optional<std::size_t> _selected;
};

} // namespace modelmatch::tui
