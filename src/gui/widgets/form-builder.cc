#include "stdinc.hpp"

#include "form-builder.hh"

#include "fauna/io/json-io.hpp"
#include "gui/qt-helpers.hpp"

#include <QCheckBox>
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QFileDialog>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QSpinBox>

namespace fauna
{
static constexpr array<const char*, 7> k_field_types
    = {"double", "int", "bool", "list", "file_open", "file_dir", "string"};

bool is_valid_field_type(const string_view type) noexcept
{
   return std::find(cbegin(k_field_types), cend(k_field_types), type)
          != cend(k_field_types);
}

bool FieldSpec::is_file_type() const noexcept
{
   return type == "file_open" or type == "file_dir";
}

string FieldSpec::to_string() const noexcept
{
   return format("{{name: '{}', label: '{}', type: {}, default: {}}}",
                 name,
                 label,
                 type,
                 json_encode(default_value));
}

// ------------------------------------------------------------- parse form spec

vector<FieldSpec> parse_form_spec(const Json::Value& o) noexcept(false)
{
   if(!o.isArray()) throw std::runtime_error("form spec must be a JSON array");

   const string op = "reading form spec";
   vector<FieldSpec> fields;
   fields.reserve(o.size());
   for(const auto& node : o) {
      FieldSpec f;
      f.name  = json_load_key<string>(node, "name", op);
      f.label = json_load_key<string>(node, "label", op);
      f.type  = json_load_key<string>(node, "type", op);
      if(has_key(node, "default")) f.default_value = node["default"];
      if(has_key(node, "filter")) json_load(node["filter"], f.filter);
      if(has_key(node, "options")) {
         const auto& opts = node["options"];
         if(opts.isArray()) {
            vector<string> ss;
            json_load(opts, ss);
            f.options = implode(cbegin(ss), cend(ss), ",");
         } else {
            json_load(opts, f.options);
         }
      }

      if(!is_valid_field_type(f.type))
         throw std::runtime_error(
             format("field '{}' has unknown type '{}'", f.name, f.type));
      fields.push_back(std::move(f));
   }
   return fields;
}

vector<FieldSpec> parse_form_spec(const string_view json_text) noexcept(false)
{
   return parse_form_spec(parse_json(string(json_text)));
}

} // namespace fauna

// -----------------------------------------------------------------------------

#define This FormBuilderLayout

using namespace fauna;

struct This::Pimpl
{
   This& parent;
   vector<FieldSpec> fields;

   Pimpl(This& in_parent, const vector<FieldSpec>& in_fields)
       : parent(in_parent)
       , fields(in_fields)
   {}

   // Keeps `default` reachable when it falls outside Qt's [0, 99] range
   template<typename SpinBox, typename T> void widen_range(SpinBox* sb, T val)
   {
      using limits   = std::numeric_limits<T>;
      auto times_ten = [](T x) -> T {
         if(x > limits::max() / 10) return limits::max();
         if(x < limits::lowest() / 10) return limits::lowest();
         return x * 10;
      };
      if(val > sb->maximum()) sb->setRange(0, times_ten(val));
      if(val < sb->minimum()) sb->setMinimum(times_ten(val));
   }

   // Qt shows 2 decimals, and rounds the value to what it shows
   static int decimals_for(const double val) noexcept
   {
      int n = 2;
      for(; n < 10; ++n) {
         const double scaled = val * std::pow(10.0, n);
         if(std::fabs(scaled - std::round(scaled)) < 1e-6) break;
      }
      return n;
   }

   QWidget* make_field_widget(const FieldSpec& f)
   {
      const auto& d = f.default_value;

      if(f.type == "double") {
         auto sb        = new QDoubleSpinBox;
         const auto val = d.isNumeric() ? d.asDouble() : 0.0;
         sb->setDecimals(decimals_for(val));
         widen_range(sb, val);
         sb->setValue(val);
         connect(sb,
                 SIGNAL(valueChanged(double)),
                 &parent,
                 SIGNAL(valueChanged()));
         return sb;
      }

      if(f.type == "int") {
         auto sb        = new QSpinBox;
         const auto val = d.isNumeric() ? d.asInt() : 0;
         widen_range(sb, val);
         sb->setValue(val);
         connect(
             sb, SIGNAL(valueChanged(int)), &parent, SIGNAL(valueChanged()));
         return sb;
      }

      if(f.type == "bool") {
         auto cb = new QCheckBox;
         cb->setChecked(d.isBool() ? d.asBool() : false);
         connect(
             cb, SIGNAL(stateChanged(int)), &parent, SIGNAL(valueChanged()));
         return cb;
      }

      if(f.type == "list") {
         auto combo      = new QComboBox;
         const auto opts = explode(f.options, ",");
         for(const auto& opt : opts) combo->addItem(to_qstr(opt));
         if(d.isString()) {
            auto ii = std::find(cbegin(opts), cend(opts), d.asString());
            if(ii != cend(opts))
               combo->setCurrentIndex(int(std::distance(cbegin(opts), ii)));
         }
         connect(combo,
                 SIGNAL(currentIndexChanged(int)),
                 &parent,
                 SIGNAL(valueChanged()));
         return combo;
      }

      // string, file_open, file_dir
      auto le = new QLineEdit;
      le->setText(to_qstr(d.isString() ? d.asString() : ""s));
      if(f.is_file_type()) le->setDisabled(true);
      connect(
          le, SIGNAL(textChanged(QString)), &parent, SIGNAL(valueChanged()));
      return le;
   }

   QPushButton* make_select_button(const FieldSpec& f, QLineEdit* le)
   {
      const auto text    = format("Select {}", f.label);
      auto button        = new QPushButton(to_qstr(text));
      const bool is_open = (f.type == "file_open");
      const auto filter  = to_qstr(f.filter);
      auto on_clicked    = [this, le, is_open, filter]() {
         QWidget* owner = parent.parentWidget();
         const QString fname
             = is_open ? QFileDialog::getOpenFileName(
                   owner, "Open File", QString{}, filter)
                       : QFileDialog::getExistingDirectory(owner,
                                                           "Open Directory");
         if(!fname.isEmpty()) le->setText(fname);
         emit parent.valueChanged();
      };
      connect(button, &QPushButton::clicked, &parent, on_clicked);
      return button;
   }

   void build_form()
   {
      for(const auto& f : fields) {
         QWidget* wgt = make_field_widget(f);
         wgt->setObjectName(to_qstr(f.name));
         parent.addRow(to_qstr(format("{}:", f.label)), wgt);

         if(f.is_file_type()) {
            auto le = qobject_cast<QLineEdit*>(wgt);
            parent.addRow("", make_select_button(f, le));
         }
      }
   }
};

// ---------------------------------------------------------------- Construction

This::This(const vector<FieldSpec>& fields, QWidget* parent)
    : QFormLayout(parent)
{
   for(const auto& f : fields)
      if(!is_valid_field_type(f.type))
         throw std::runtime_error(
             format("field '{}' has unknown type '{}'", f.name, f.type));

   pimpl_ = make_unique<Pimpl>(*this, fields);
   pimpl_->build_form();
}

This::~This() = default;

// ---------------------------------------------------------------------- fields

const vector<FieldSpec>& This::fields() const noexcept
{
   return pimpl_->fields;
}

// ---------------------------------------------------------------- field widget

QWidget* This::field_widget(const string_view name) const noexcept
{
   const auto qname = to_qstr(name);
   for(auto i = 0; i < count(); ++i) {
      QWidget* wgt = itemAt(i)->widget();
      if(wgt != nullptr and wgt->objectName() == qname) return wgt;
   }
   return nullptr;
}

// ------------------------------------------------------------ get widget value

Json::Value This::get_widget_value(const QWidget* widget) noexcept
{
   if(auto cb = qobject_cast<const QCheckBox*>(widget))
      return Json::Value{cb->isChecked()};
   if(auto sb = qobject_cast<const QSpinBox*>(widget))
      return Json::Value{sb->value()};
   if(auto sb = qobject_cast<const QDoubleSpinBox*>(widget))
      return Json::Value{sb->value()};
   if(auto combo = qobject_cast<const QComboBox*>(widget))
      return Json::Value{from_qstr(combo->currentText())};
   if(auto le = qobject_cast<const QLineEdit*>(widget))
      return Json::Value{from_qstr(le->text())};
   return Json::Value{Json::nullValue};
}

// --------------------------------------------------------------- get form data

Json::Value This::get_form_data() const noexcept
{
   Json::Value o{Json::objectValue};
   for(auto i = 0; i < count(); ++i) {
      const QWidget* wgt = itemAt(i)->widget();
      if(wgt == nullptr or wgt->objectName().isEmpty()) continue;
      if(qobject_cast<const QLabel*>(wgt)
         or qobject_cast<const QPushButton*>(wgt))
         continue;
      o[from_qstr(wgt->objectName())] = get_widget_value(wgt);
   }
   return o;
}

// --------------------------------------------------------------- set form data

void This::set_form_data(const Json::Value& o) noexcept(false)
{
   if(!o.isObject())
      throw std::runtime_error("form data must be a JSON object");

   for(const auto& name : o.getMemberNames()) {
      QWidget* wgt = field_widget(name);
      if(wgt == nullptr) {
         WARN(format("form has no field named '{}'", name));
         continue;
      }

      const auto& val = o[name];
      if(auto cb = qobject_cast<QCheckBox*>(wgt)) {
         bool x = false;
         json_load(val, x);
         block_signal_set(cb, x);
      } else if(auto sb = qobject_cast<QSpinBox*>(wgt)) {
         int x = 0;
         json_load(val, x);
         block_signal_set(sb, x);
      } else if(auto sb = qobject_cast<QDoubleSpinBox*>(wgt)) {
         double x = 0.0;
         json_load(val, x);
         block_signal_set(sb, x);
      } else if(auto combo = qobject_cast<QComboBox*>(wgt)) {
         string x;
         json_load(val, x);
         const auto idx = combo->findText(to_qstr(x));
         if(idx < 0)
            throw std::runtime_error(
                format("'{}' is not an option for field '{}'", x, name));
         block_signal_set(combo, idx);
      } else if(auto le = qobject_cast<QLineEdit*>(wgt)) {
         string x;
         json_load(val, x);
         block_signal_set(le, x);
      }
   }
}
