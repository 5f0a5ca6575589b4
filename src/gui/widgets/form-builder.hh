#pragma once

#include <QFormLayout>

#include "stdinc.hpp"

#include "json/json.h"

namespace fauna
{
// One row of a declarative form
struct FieldSpec
{
   string name;  // key in `get_form_data`
   string label; // shown in the form
   string type;  // double, int, bool, list, file_open, file_dir, string
   Json::Value default_value = Json::Value{Json::nullValue};
   string options            = ""s; // comma separated, for `list`
   string filter             = "Any File (*.*)"s; // for `file_open`

   bool is_file_type() const noexcept;

   string to_string() const noexcept;
   friend string str(const FieldSpec& o) noexcept { return o.to_string(); }
};

bool is_valid_field_type(const string_view type) noexcept;

// Reads a JSON array of {name, label, type, default, options?, filter?}
vector<FieldSpec> parse_form_spec(const Json::Value& o) noexcept(false);
vector<FieldSpec> parse_form_spec(const string_view json_text) noexcept(false);

} // namespace fauna

// A QFormLayout that populates itself from a list of fields
class FormBuilderLayout final : public QFormLayout
{
   Q_OBJECT

 private:
   struct Pimpl;
   std::unique_ptr<Pimpl> pimpl_;

 public:
   using FieldSpec = fauna::FieldSpec;

   // Throws std::runtime_error on an unknown field type
   FormBuilderLayout(const std::vector<FieldSpec>& fields,
                     QWidget* parent = nullptr);
   FormBuilderLayout(const FormBuilderLayout&) = delete;
   FormBuilderLayout(FormBuilderLayout&&)      = delete;
   virtual ~FormBuilderLayout();

   FormBuilderLayout& operator=(const FormBuilderLayout&) = delete;
   FormBuilderLayout& operator=(FormBuilderLayout&&) = delete;

   const std::vector<FieldSpec>& fields() const noexcept;

   // The widget holding the named field's value, or nullptr
   QWidget* field_widget(const std::string_view name) const noexcept;

   // {name: value} for every user-editable widget in the form
   Json::Value get_form_data() const noexcept;

   // Sets the widgets named in `o`, without emitting signals
   void set_form_data(const Json::Value& o) noexcept(false);

   // bool, number, or string. Json null for unsupported widgets
   static Json::Value get_widget_value(const QWidget* widget) noexcept;

 signals:
   void valueChanged();
};
